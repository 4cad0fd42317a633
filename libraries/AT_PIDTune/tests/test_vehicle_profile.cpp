#include <AT_gtest.h>

#include <AT_PIDTune/AT_VehicleProfile.h>

static AT_PIDTune::Tuning sample_tuning()
{
    AT_PIDTune::Tuning t {};
    for (uint8_t a = 0; a < AT_NUM_AXES; a++) {
        t.axis[a].p = 40;
        t.axis[a].i = 80;
        t.axis[a].d = a == uint8_t(AT_Axis::YAW) ? 10 : 20;
        t.axis[a].confidence = AT_PIDTune::Confidence::MEDIUM;
        t.axis[a].critical = AT_PIDTune::default_critical();
    }
    t.fallback = false;
    return t;
}

TEST(VehicleProfileTest, Defaults)
{
    AT_VehicleProfile v;
    EXPECT_FALSE(v.enabled());
    EXPECT_FLOAT_EQ(400.0f, v.weight_g());
    EXPECT_FLOAT_EQ(14.8f, v.battery_voltage());

    const AT_VehicleProfile::Factors f = v.factors();
    EXPECT_FLOAT_EQ(1.0f, f.kp);
    EXPECT_FLOAT_EQ(1.0f, f.ki);
    EXPECT_FLOAT_EQ(1.0f, f.kd);
}

TEST(VehicleProfileTest, SmallLightHighVoltage)
{
    AT_VehicleProfile v;
    v._prop_in.set(3);
    v._weight_g.set(200);
    v._cells.set(6);
    v._motor_kv.set(2700);

    const AT_VehicleProfile::Factors f = v.factors();
    EXPECT_NEAR(1.2636f, f.kp, 1e-4f);
    EXPECT_NEAR(0.72f, f.ki, 1e-4f);
    EXPECT_NEAR(1.32f, f.kd, 1e-4f);
}

TEST(VehicleProfileTest, LargeHeavyLowVoltage)
{
    AT_VehicleProfile v;
    v._prop_in.set(8);
    v._weight_g.set(800);
    v._cells.set(2);
    v._motor_kv.set(1500);

    const AT_VehicleProfile::Factors f = v.factors();
    EXPECT_NEAR(0.8712f, f.kp, 1e-4f);
    EXPECT_NEAR(1.859f, f.ki, 1e-4f);
    EXPECT_NEAR(0.56f, f.kd, 1e-4f);
}

TEST(VehicleProfileTest, ThreeCellsIsNeutral)
{
    AT_VehicleProfile v;
    v._cells.set(3);
    EXPECT_FLOAT_EQ(1.0f, v.factors().kp);
}

TEST(VehicleProfileTest, AxisAdjustments)
{
    AT_VehicleProfile v;
    AT_VehicleProfile::Factors yaw = v.axis_factors(AT_Axis::YAW);
    EXPECT_FLOAT_EQ(0.8f, yaw.kp);
    EXPECT_FLOAT_EQ(1.2f, yaw.ki);
    EXPECT_FLOAT_EQ(0.5f, yaw.kd);

    EXPECT_FLOAT_EQ(1.0f, v.axis_factors(AT_Axis::ROLL).kp);

    v._frame.set(int8_t(AT_VehicleProfile::Frame::H));
    const AT_VehicleProfile::Factors roll = v.axis_factors(AT_Axis::ROLL);
    EXPECT_FLOAT_EQ(0.95f, roll.kp);
    EXPECT_FLOAT_EQ(1.05f, roll.ki);
    EXPECT_FLOAT_EQ(1.0f, v.axis_factors(AT_Axis::PITCH).kp);
}

TEST(VehicleProfileTest, ApplyScalesAndClamps)
{
    AT_VehicleProfile v;
    v._prop_in.set(3);

    AT_PIDTune::Tuning t = sample_tuning();
    v.apply(t);

    EXPECT_EQ(52U, t.axis[0].p);
    EXPECT_EQ(64U, t.axis[0].i);
    EXPECT_EQ(24U, t.axis[0].d);

    EXPECT_EQ(42U, t.axis[2].p);
    EXPECT_EQ(77U, t.axis[2].i);
    EXPECT_EQ(6U, t.axis[2].d);

    ASSERT_EQ(1U, t.notes.size());
    EXPECT_EQ("Gains scaled for a 3 in, 400 g, 4S, 2300 KV X frame", t.notes[0]);

    // large scale factors stay inside the axis bounds
    v._prop_in.set(2);
    v._weight_g.set(100);
    t.axis[0].p = 80;
    v.apply(t);
    EXPECT_EQ(80U, t.axis[0].p);
}

TEST(VehicleProfileTest, FallbackUntouched)
{
    AT_VehicleProfile v;
    v._prop_in.set(3);

    AT_PIDTune::Tuning t = sample_tuning();
    t.fallback = true;
    v.apply(t);
    EXPECT_EQ(40U, t.axis[0].p);
    EXPECT_TRUE(t.notes.empty());
}

TEST(VehicleProfileTest, ParamsByName)
{
    AT_VehicleProfile v;
    AT_ParamTable table;
    table.add_group("VEH_", &v, AT_VehicleProfile::var_info);
    EXPECT_EQ(6U, table.count());

    EXPECT_TRUE(table.set_by_name("VEH_ENABLE", 1));
    EXPECT_TRUE(table.set_by_name("VEH_WEIGHT_G", 750));
    EXPECT_TRUE(v.enabled());
    EXPECT_FLOAT_EQ(750.0f, v.weight_g());
}

AT_GTEST_MAIN()
