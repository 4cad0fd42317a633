#include <AT_gtest.h>

#include <AT_InternalError/AT_InternalError.h>

TEST(InternalErrorTest, StartsClean)
{
    AT::internalerror().reset();
    EXPECT_EQ(0U, AT::internalerror().errors());
    EXPECT_EQ(0U, AT::internalerror().count());
}

TEST(InternalErrorTest, ErrorNames)
{
    EXPECT_STREQ("bad_ctrl_type",
                 AT_InternalError::error_to_string(AT_InternalError::error_t::invalid_controller_type));
    EXPECT_STREQ("log_bad_fmt",
                 AT_InternalError::error_to_string(AT_InternalError::error_t::logger_bad_format));
    EXPECT_STREQ("unknown",
                 AT_InternalError::error_to_string(AT_InternalError::error_t::__LAST__));
}

TEST(InternalErrorDeathTest, FatalByDefault)
{
    EXPECT_DEATH(INTERNAL_ERROR(AT_InternalError::error_t::param_table), "internal error param_table");
}

AT_GTEST_MAIN()
