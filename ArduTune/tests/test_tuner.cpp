#include <AT_gtest.h>

#include <stdlib.h>

#include <ArduTune/ArduTune.h>
#include <AT_Logger/AT_Logger.h>
#include <AT_test_signals.h>

// 180 Hz resonance of 20 deg/s on a 5 deg/s offset, 1 kHz logging
static AT_SampleLog resonant_log()
{
    return AT_Test::gyro_log(AT_Test::sine(180, 20, 1000, 2048, 5), 1000);
}

static float metric_value(const Report &report, const char *label)
{
    const std::string *v = report.metric(label);
    return v == nullptr ? -1.0f : strtof(v->c_str(), nullptr);
}

TEST(TunerTest, ParameterTable)
{
    Tuner tuner;
    EXPECT_EQ(13U, tuner.param_table().count());

    float v = 0;
    EXPECT_TRUE(tuner.param_table().get_by_name("TUNE_FFT_SIZE", v));
    EXPECT_FLOAT_EQ(1024.0f, v);
    EXPECT_TRUE(tuner.param_table().get_by_name("TUNE_FW_VER", v));
    EXPECT_FLOAT_EQ(4.3f, v);
    EXPECT_TRUE(tuner.param_table().get_by_name("VEH_CELLS", v));
    EXPECT_FLOAT_EQ(4.0f, v);

    EXPECT_TRUE(tuner.param_table().set_by_name("TUNE_NOISE_LVL", 65));
    EXPECT_FLOAT_EQ(65.0f, tuner.params().noise_level.get());
}

TEST(TunerTest, ResonantLog)
{
    Tuner tuner;
    ASSERT_TRUE(tuner.param_table().set_by_name("TUNE_NOISE_LVL", 65));

    AT_Logger logger;
    Report report;
    ASSERT_EQ(Tuner::Result::OK, tuner.analyse(resonant_log(), "4.4", report, &logger));

    EXPECT_FLOAT_EQ(1000.0f, report.sample_rate_hz);
    EXPECT_FLOAT_EQ(65.0f, report.noise_level);
    ASSERT_NE(nullptr, report.firmware);
    EXPECT_STREQ("4.4", report.firmware->name);

    // 180 Hz lands in bin 184 of a 1024 point transform
    const AT_Spectrum::Analysis &roll = report.axes[uint8_t(AT_Axis::ROLL)];
    ASSERT_EQ(512U, roll.spectrum.size());
    ASSERT_FALSE(roll.dominant.empty());
    EXPECT_FLOAT_EQ(179.6875f, roll.dominant[0].freq_hz);

    // identical axes share the resonance
    ASSERT_EQ(1U, report.common.size());
    EXPECT_EQ(0x7, report.common[0].axis_mask);
    ASSERT_EQ(1U, report.propagation.size());
    EXPECT_EQ(AT_Axis::ROLL, report.propagation[0].source);
    ASSERT_EQ(2U, report.propagation[0].targets.size());
    EXPECT_NEAR(1.0f, report.propagation[0].targets[0].magnitude_ratio, 1e-5f);
    EXPECT_EQ(3U, report.interactions.size());

    const AT_FilterAdvisor::Recommendations &f = report.filters;
    EXPECT_EQ(AT_FilterAdvisor::Topology::BIQUAD, f.gyro_lowpass.topology);
    EXPECT_FLOAT_EQ(126.0f, f.gyro_lowpass.cutoff_hz);
    EXPECT_EQ(88U, f.gyro_lowpass.dynamic_min_hz);
    EXPECT_EQ(189U, f.gyro_lowpass.dynamic_max_hz);
    EXPECT_FLOAT_EQ(108.0f, f.dterm_lowpass.cutoff_hz);

    ASSERT_TRUE(f.notch.enabled);
    EXPECT_EQ(90U, f.notch.dynamic_min_hz);
    EXPECT_EQ(359U, f.notch.dynamic_max_hz);
    EXPECT_EQ(5U, f.notch.notch_count);
    EXPECT_EQ(600U, f.notch.q);

    // Mechanical High and Aliasing bands both carry the resonance
    ASSERT_EQ(1U, f.additional.size());
    EXPECT_EQ("RPM filter", f.additional[0].title);

    // error oscillates far faster than the shortest accepted period
    EXPECT_FALSE(report.pid.fallback);
    EXPECT_FLOAT_EQ(0.05f, report.pid.axis[0].critical.tu);
    EXPECT_EQ("set p_roll = 20\n"
              "set i_roll = 120\n"
              "set d_roll = 10\n"
              "set p_pitch = 20\n"
              "set i_pitch = 120\n"
              "set d_pitch = 10\n"
              "set p_yaw = 20\n"
              "set i_yaw = 120\n"
              "set d_yaw = 0", report.pid_commands());

    EXPECT_NEAR(14.14f, metric_value(report, "Gyro Noise (Roll)"), 0.1f);
    EXPECT_NEAR(15.0f, metric_value(report, "PID Error (Pitch)"), 0.1f);
    EXPECT_FLOAT_EQ(0.0f, metric_value(report, "Motor Balance"));
    EXPECT_FLOAT_EQ(0.0f, metric_value(report, "Response Time (ms)"));
    ASSERT_NE(nullptr, report.metric("Dominant Frequency (Hz)"));
    EXPECT_EQ("179.7", *report.metric("Dominant Frequency (Hz)"));
    EXPECT_EQ("65.0", *report.metric("FFT Noise Level"));
    EXPECT_NE(nullptr, report.metric("Peak 1 (179.7 Hz)"));
    EXPECT_EQ("Gyro Noise (Roll)", report.metrics[0].first);
    EXPECT_EQ("Response Time (ms)", report.metrics[7].first);

    EXPECT_EQ(3U, logger.count("SPEC"));
    EXPECT_EQ(3U, logger.count("CPLG"));
    EXPECT_EQ(1U, logger.count("FLTR"));
    EXPECT_EQ(3U, logger.count("PIDT"));
    const AT_Logger::Record *rec = logger.find("TUNE");
    ASSERT_NE(nullptr, rec);
    EXPECT_EQ(1024.0f, rec->get("N"));
    EXPECT_EQ(404.0f, rec->get("Ver"));
    EXPECT_EQ(1.0f, rec->get("NCom"));
    EXPECT_EQ(0.0f, rec->get("Fallback"));
}

TEST(TunerTest, CommandScriptLayout)
{
    Tuner tuner;
    Report report;
    ASSERT_EQ(Tuner::Result::OK,
              tuner.analyse(AT_Test::gyro_log(std::vector<float>(5, 0.0f), 1000), nullptr, report));

    EXPECT_TRUE(report.pid.fallback);
    EXPECT_STREQ("4.3", report.firmware->name);
    EXPECT_EQ(8U, report.metrics.size());
    EXPECT_EQ("set p_roll = 40\n"
              "set i_roll = 80\n"
              "set d_roll = 25\n"
              "set p_pitch = 40\n"
              "set i_pitch = 80\n"
              "set d_pitch = 25\n"
              "set p_yaw = 50\n"
              "set i_yaw = 80\n"
              "set d_yaw = 0\n"
              "\n"
              "set gyro_lowpass_type = PT1\n"
              "set gyro_lowpass_hz = 150\n"
              "set dterm_lowpass_type = PT1\n"
              "set dterm_lowpass_hz = 120\n"
              "set dyn_notch_enable = OFF\n"
              "\n"
              "save", report.command_script());
}

TEST(TunerTest, SynthesizedAndRecordedLogsAgree)
{
    // the same samples built two ways give the same report
    const std::vector<float> gyro = AT_Test::sine(180, 20, 1000, 1500, 5);
    const AT_SampleLog synthesized = AT_Test::gyro_log(gyro, 1000);

    std::vector<AT_Sample> samples;
    for (uint32_t i = 0; i < gyro.size(); i++) {
        AT_Sample s = AT_Test::blank_sample(float(i));
        s.gyro.x = s.gyro.y = s.gyro.z = gyro[i];
        for (uint8_t m = 0; m < 4; m++) {
            s.motor[m] = 1500;
        }
        samples.push_back(s);
    }
    const AT_SampleLog recorded(std::move(samples));

    Tuner tuner;
    Report r1, r2;
    ASSERT_EQ(Tuner::Result::OK, tuner.analyse(synthesized, "4.3", r1));
    ASSERT_EQ(Tuner::Result::OK, tuner.analyse(recorded, "4.3", r2));
    EXPECT_EQ(r1.command_script(), r2.command_script());
    EXPECT_EQ(r1.metrics, r2.metrics);

    // a tuner keeps no state between runs
    Report r3;
    ASSERT_EQ(Tuner::Result::OK, tuner.analyse(synthesized, "4.3", r3));
    EXPECT_EQ(r1.command_script(), r3.command_script());
}

TEST(TunerTest, BadFFTSize)
{
    Tuner tuner;
    ASSERT_TRUE(tuner.param_table().set_by_name("TUNE_FFT_SIZE", 1000));

    AT_Logger logger;
    Report report;
    EXPECT_EQ(Tuner::Result::BAD_FFT_SIZE, tuner.analyse(resonant_log(), "4.4", report, &logger));
    EXPECT_TRUE(logger.have_message_containing("TUNE_FFT_SIZE 1000"));
    EXPECT_EQ(nullptr, logger.find("TUNE"));
}

TEST(TunerTest, ConfiguredSampleRateAndFirmware)
{
    Tuner tuner;
    ASSERT_TRUE(tuner.param_table().set_by_name("TUNE_SMPL_RATE", 2000));
    ASSERT_TRUE(tuner.param_table().set_by_name("TUNE_FW_VER", 4.2f));

    Report report;
    ASSERT_EQ(Tuner::Result::OK, tuner.analyse(resonant_log(), "", report));
    EXPECT_FLOAT_EQ(2000.0f, report.sample_rate_hz);
    EXPECT_STREQ("4.2", report.firmware->name);
    EXPECT_FLOAT_EQ(1.953125f, report.axes[0].spectrum[1].freq_hz);

    // a version string from the caller takes precedence over TUNE_FW_VER
    Report named;
    ASSERT_EQ(Tuner::Result::OK, tuner.analyse(resonant_log(), "4.4", named));
    EXPECT_STREQ("4.4", named.firmware->name);
    Report unnamed;
    ASSERT_EQ(Tuner::Result::OK, tuner.analyse(resonant_log(), nullptr, unnamed));
    EXPECT_STREQ("4.2", unnamed.firmware->name);
}

TEST(TunerTest, ShortChannelsSkippedWithoutPadding)
{
    Tuner tuner;
    ASSERT_TRUE(tuner.param_table().set_by_name("TUNE_FFT_PAD", 0));

    AT_Logger logger;
    Report report;
    ASSERT_EQ(Tuner::Result::OK,
              tuner.analyse(AT_Test::gyro_log(AT_Test::sine(50, 1, 1000, 100), 1000), "4.4", report, &logger));
    for (uint8_t a = 0; a < AT_NUM_AXES; a++) {
        EXPECT_TRUE(report.axes[a].spectrum.empty());
    }
    EXPECT_TRUE(report.common.empty());
    EXPECT_TRUE(report.propagation.empty());
    EXPECT_TRUE(report.interactions.empty());
    EXPECT_TRUE(logger.have_message_containing("Roll gyro skipped"));
    EXPECT_EQ(0U, logger.count("SPEC"));
    EXPECT_EQ(0U, logger.count("CPLG"));
}

TEST(TunerTest, SilentLogHasNoCoupling)
{
    Tuner tuner;
    Report report;
    ASSERT_EQ(Tuner::Result::OK,
              tuner.analyse(AT_Test::gyro_log(std::vector<float>(2048, 0.0f), 1000), "4.4", report));
    for (uint8_t a = 0; a < AT_NUM_AXES; a++) {
        EXPECT_TRUE(report.axes[a].dominant.empty());
    }
    EXPECT_TRUE(report.common.empty());
    ASSERT_EQ(3U, report.interactions.size());
    for (const AT_SpectrumCoupling::AxisInteraction &ia : report.interactions) {
        EXPECT_FLOAT_EQ(0.0f, ia.correlation);
        EXPECT_FLOAT_EQ(0.0f, ia.coupling_strength);
    }
}

TEST(TunerTest, VehicleScaling)
{
    Tuner tuner;
    ASSERT_TRUE(tuner.param_table().set_by_name("TUNE_NOISE_LVL", 65));
    ASSERT_TRUE(tuner.param_table().set_by_name("VEH_ENABLE", 1));
    ASSERT_TRUE(tuner.param_table().set_by_name("VEH_PROP_IN", 3));

    Report report;
    ASSERT_EQ(Tuner::Result::OK, tuner.analyse(resonant_log(), "4.4", report));
    EXPECT_EQ(26U, report.pid.axis[0].p);
    EXPECT_EQ(96U, report.pid.axis[0].i);
    EXPECT_EQ(12U, report.pid.axis[0].d);
    EXPECT_NE(std::string::npos, report.pid.notes.back().find("Gains scaled for a 3 in"));
}

TEST(TunerTest, ResponseTime)
{
    const std::vector<float> cmd = AT_Test::sine(10, 1, 1000, 1000);
    std::vector<float> resp(cmd.size(), 0.0f);
    for (uint32_t i = 20; i < resp.size(); i++) {
        resp[i] = cmd[i - 20];
    }
    EXPECT_FLOAT_EQ(20.0f, Tuner::response_time_ms(cmd, resp, 1000));
    // lag search stops at 10 ms
    EXPECT_FLOAT_EQ(10.0f, Tuner::response_time_ms(cmd, resp, 1000, 10));
    EXPECT_FLOAT_EQ(0.0f, Tuner::response_time_ms(cmd, std::vector<float>(1000, 3.0f), 1000));
    EXPECT_FLOAT_EQ(0.0f, Tuner::response_time_ms(cmd, resp, 0));
}

AT_GTEST_MAIN()
