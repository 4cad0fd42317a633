#include <AT_gtest.h>

#include <cmath>

#include <AT_Logger/AT_Logger.h>

TEST(LoggerTest, RecordFields)
{
    AT_Logger logger;
    logger.Write("TEST", "A,B,C,D,E", "fBhIQ", 1.5f, uint8_t(7), int16_t(-3), uint32_t(100000), uint64_t(42));

    ASSERT_EQ(1U, logger.count("TEST"));
    const AT_Logger::Record *rec = logger.find("TEST");
    ASSERT_NE(nullptr, rec);
    ASSERT_EQ(5U, rec->values.size());
    EXPECT_EQ(1.5f, rec->get("A"));
    EXPECT_EQ(7.0f, rec->get("B"));
    EXPECT_EQ(-3.0f, rec->get("C"));
    EXPECT_EQ(100000.0f, rec->get("D"));
    EXPECT_EQ(42.0f, rec->get("E"));
    EXPECT_TRUE(std::isnan(rec->get("Z")));
}

TEST(LoggerTest, FindReturnsMostRecent)
{
    AT_Logger logger;
    logger.Write("SPEC", "N", "H", uint16_t(256));
    logger.Write("SPEC", "N", "H", uint16_t(1024));
    EXPECT_EQ(2U, logger.count("SPEC"));
    EXPECT_EQ(1024.0f, logger.find("SPEC")->get("N"));
    EXPECT_EQ(nullptr, logger.find("NONE"));
}

TEST(LoggerTest, MessagesAlwaysKept)
{
    AT_Logger logger;
    logger.set_level(AT_Logger::Severity::WARNING);
    logger.Write_MessageF(AT_Logger::Severity::DEBUG, "window %u", 512U);
    logger.Write_Message(AT_Logger::Severity::ERROR, "bad size");

    ASSERT_EQ(2U, logger.messages().size());
    EXPECT_TRUE(logger.have_message_containing("window 512"));
    EXPECT_EQ(AT_Logger::Severity::ERROR, logger.messages()[1].severity);
}

TEST(LoggerTest, ConsoleEchoHonoursLevel)
{
    AT_Logger logger;
    FILE *f = tmpfile();
    ASSERT_NE(nullptr, f);
    logger.set_console(f);
    logger.set_level(AT_Logger::Severity::WARNING);
    logger.Write_Message(AT_Logger::Severity::INFO, "quiet");
    logger.Write_Message(AT_Logger::Severity::WARNING, "loud");

    rewind(f);
    char buf[128] {};
    const size_t n = fread(buf, 1, sizeof(buf) - 1, f);
    fclose(f);
    const std::string out(buf, n);
    EXPECT_EQ(std::string::npos, out.find("quiet"));
    EXPECT_NE(std::string::npos, out.find("WARNING: loud"));
}

TEST(LoggerTest, NullLoggerMacro)
{
    AT_Logger *none = nullptr;
    AT_LOG_TEXT(none, AT_Logger::Severity::INFO, "ignored %d", 1);

    AT_Logger logger;
    AT_LOG_TEXT(&logger, AT_Logger::Severity::INFO, "kept %d", 2);
    EXPECT_TRUE(logger.have_message_containing("kept 2"));

    logger.clear();
    EXPECT_TRUE(logger.messages().empty());
}

TEST(LoggerDeathTest, LabelCountMismatch)
{
    AT_Logger logger;
    EXPECT_DEATH(logger.Write("BAD", "A,B", "f", 1.0f), "log_bad_fmt");
}

AT_GTEST_MAIN()
