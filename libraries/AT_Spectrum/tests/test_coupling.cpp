#include <AT_gtest.h>

#include <AT_Logger/AT_Logger.h>
#include <AT_Spectrum/AT_SpectrumCoupling.h>
#include <AT_test_signals.h>

typedef AT_SpectrumCoupling::PointList PointList;

static AT_Spectrum::Point pt(float f, float m, float phase = 0)
{
    return AT_Spectrum::Point{f, m, phase};
}

TEST(CouplingTest, CommonFrequencies)
{
    PointList dominant[AT_NUM_AXES];
    dominant[0] = { pt(100, 1.0f), pt(200, 0.5f) };
    dominant[1] = { pt(102, 0.8f), pt(250, 0.6f) };
    dominant[2] = { pt(300, 0.4f), pt(252, 0.2f) };

    const std::vector<AT_SpectrumCoupling::CommonFrequency> common =
        AT_SpectrumCoupling::find_common_frequencies(dominant);
    ASSERT_EQ(2U, common.size());

    EXPECT_FLOAT_EQ(101.0f, common[0].freq_hz);
    EXPECT_FLOAT_EQ(0.9f, common[0].magnitude);
    EXPECT_EQ(0x3, common[0].axis_mask);

    EXPECT_FLOAT_EQ(251.0f, common[1].freq_hz);
    EXPECT_FLOAT_EQ(0.4f, common[1].magnitude);
    EXPECT_EQ(0x6, common[1].axis_mask);
}

TEST(CouplingTest, NothingShared)
{
    PointList dominant[AT_NUM_AXES];
    dominant[0] = { pt(100, 1.0f) };
    dominant[1] = { pt(150, 1.0f) };
    EXPECT_TRUE(AT_SpectrumCoupling::find_common_frequencies(dominant).empty());
}

TEST(CouplingTest, PropagationFromStrongestAxis)
{
    AT_Spectrum fft;
    ASSERT_EQ(AT_Spectrum::Result::OK, fft.init(1024, 1024.0f, AT_Spectrum::WindowMode::NONE));

    const std::vector<float> gyro[AT_NUM_AXES] = {
        AT_Test::sine(100, 1.0f, 1024, 1024),
        // quarter period behind roll
        AT_Test::sine(100, 0.5f, 1024, 1024, 0.0f, -float(M_PI_2)),
        std::vector<float>(1024, 0.0f),
    };

    PointList spectra[AT_NUM_AXES];
    PointList dominant[AT_NUM_AXES];
    for (uint8_t i = 0; i < AT_NUM_AXES; i++) {
        AT_Spectrum::Analysis a;
        ASSERT_EQ(AT_Spectrum::Result::OK, fft.analyse(gyro[i], a));
        spectra[i] = a.spectrum;
        dominant[i] = a.dominant;
    }
    EXPECT_TRUE(dominant[2].empty());

    const std::vector<AT_SpectrumCoupling::CommonFrequency> common =
        AT_SpectrumCoupling::find_common_frequencies(dominant);
    ASSERT_EQ(1U, common.size());

    const std::vector<AT_SpectrumCoupling::Propagation> prop =
        AT_SpectrumCoupling::analyse_propagation(fft, spectra, common);
    ASSERT_EQ(1U, prop.size());
    EXPECT_FLOAT_EQ(100.0f, prop[0].freq_hz);
    EXPECT_EQ(AT_Axis::ROLL, prop[0].source);
    ASSERT_EQ(1U, prop[0].targets.size());

    const AT_SpectrumCoupling::Propagation::Target &t = prop[0].targets[0];
    EXPECT_EQ(AT_Axis::PITCH, t.axis);
    EXPECT_NEAR(-M_PI_2, t.phase_diff, 1e-3);
    EXPECT_NEAR(-2.5f, t.delay_ms, 1e-3f);
    EXPECT_NEAR(0.5f, t.magnitude_ratio, 1e-3f);
}

TEST(CouplingTest, CrossCorrelation)
{
    const std::vector<float> a = AT_Test::sine(5, 1, 100, 100);
    std::vector<float> neg(a.size());
    for (uint32_t i = 0; i < a.size(); i++) {
        neg[i] = -2.0f * a[i] + 3.0f;
    }
    EXPECT_NEAR(1.0f, AT_SpectrumCoupling::cross_correlation(a, a), 1e-5f);
    EXPECT_NEAR(-1.0f, AT_SpectrumCoupling::cross_correlation(a, neg), 1e-5f);
    EXPECT_FLOAT_EQ(0.0f, AT_SpectrumCoupling::cross_correlation(a, std::vector<float>(100, 4.0f)));
    EXPECT_FLOAT_EQ(0.0f, AT_SpectrumCoupling::cross_correlation(a, {}));
}

TEST(CouplingTest, PhaseRelation)
{
    const PointList d1 = { pt(100, 1.0f, 0.5f) };
    const PointList d2 = { pt(102, 2.0f, 0.0f), pt(300, 1.0f, 2.0f) };
    EXPECT_NEAR(0.5f, AT_SpectrumCoupling::phase_relation(d1, d2), 1e-6f);

    const PointList far = { pt(120, 1.0f, 1.0f) };
    EXPECT_FLOAT_EQ(0.0f, AT_SpectrumCoupling::phase_relation(d1, far));
}

TEST(CouplingTest, CouplingStrength)
{
    const PointList d1 = { pt(100, 1.0f) };
    const PointList d2 = { pt(101, 1.0f) };
    EXPECT_NEAR(1.0f, AT_SpectrumCoupling::coupling_strength(d1, d2, 1.0f, 0.0f), 1e-5f);
    EXPECT_NEAR(0.3f, AT_SpectrumCoupling::coupling_strength(d1, d2, 0.0f, float(M_PI_2)), 1e-5f);
    EXPECT_NEAR(0.6f, AT_SpectrumCoupling::coupling_strength(d1, d2, NAN, NAN), 1e-5f);
}

TEST(CouplingTest, NoPeaksNoCoupling)
{
    const PointList d2 = { pt(101, 1.0f) };
    EXPECT_FLOAT_EQ(0.0f, AT_SpectrumCoupling::coupling_strength({}, d2, 1.0f, 0.0f));
    EXPECT_FLOAT_EQ(0.0f, AT_SpectrumCoupling::coupling_strength(d2, {}, 1.0f, 0.0f));
    EXPECT_FLOAT_EQ(0.0f, AT_SpectrumCoupling::coupling_strength({}, {}, 0.0f, 0.0f));

    // all-zero channels: no variance and no dominant frequencies
    const std::vector<float> gyro[AT_NUM_AXES] = {
        std::vector<float>(256, 0.0f),
        std::vector<float>(256, 0.0f),
        std::vector<float>(256, 0.0f),
    };
    PointList dominant[AT_NUM_AXES];
    const std::vector<AT_SpectrumCoupling::AxisInteraction> ia =
        AT_SpectrumCoupling::analyse_axes(gyro, dominant);
    ASSERT_EQ(3U, ia.size());
    for (const AT_SpectrumCoupling::AxisInteraction &i : ia) {
        EXPECT_FLOAT_EQ(0.0f, i.correlation);
        EXPECT_FLOAT_EQ(0.0f, i.coupling_strength);
    }
}

TEST(CouplingTest, CouplingGrowsWithSharedPeaks)
{
    const PointList d1 = { pt(100, 1.0f), pt(200, 1.0f), pt(300, 1.0f) };
    const PointList none = { pt(130, 1.0f), pt(230, 1.0f), pt(330, 1.0f) };
    const PointList one = { pt(101, 1.0f), pt(230, 1.0f), pt(330, 1.0f) };
    const PointList all = { pt(101, 1.0f), pt(202, 1.0f), pt(298, 1.0f) };

    const float c0 = AT_SpectrumCoupling::coupling_strength(d1, none, 0.5f, 1.0f);
    const float c1 = AT_SpectrumCoupling::coupling_strength(d1, one, 0.5f, 1.0f);
    const float c3 = AT_SpectrumCoupling::coupling_strength(d1, all, 0.5f, 1.0f);
    EXPECT_LT(c0, c1);
    EXPECT_LT(c1, c3);
    EXPECT_GE(c0, 0.0f);
    EXPECT_LE(c3, 1.0f);

    // out of range inputs stay within [0, 1]
    EXPECT_LE(AT_SpectrumCoupling::coupling_strength(d1, all, 5.0f, 0.0f), 1.0f);
    EXPECT_GE(AT_SpectrumCoupling::coupling_strength(d1, none, -5.0f, 0.0f), 0.0f);
}

TEST(CouplingTest, AxisPairsSkipEmptyChannels)
{
    AT_Logger logger;
    const std::vector<float> gyro[AT_NUM_AXES] = {
        AT_Test::sine(5, 1, 100, 100),
        AT_Test::sine(5, 1, 100, 100),
        {},
    };
    PointList dominant[AT_NUM_AXES];
    dominant[0] = { pt(5, 1.0f, 0.5f) };
    dominant[1] = { pt(5, 1.0f, 0.5f) };

    const std::vector<AT_SpectrumCoupling::AxisInteraction> ia =
        AT_SpectrumCoupling::analyse_axes(gyro, dominant, &logger);
    ASSERT_EQ(1U, ia.size());
    EXPECT_EQ(AT_Axis::ROLL, ia[0].axis1);
    EXPECT_EQ(AT_Axis::PITCH, ia[0].axis2);
    EXPECT_NEAR(1.0f, ia[0].correlation, 1e-5f);
    EXPECT_FLOAT_EQ(0.0f, ia[0].phase_relation);
    EXPECT_NEAR(1.0f, ia[0].coupling_strength, 1e-5f);
    EXPECT_EQ(1U, logger.count("CPLG"));
}

AT_GTEST_MAIN()
