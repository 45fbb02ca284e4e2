#include <DR_gtest.h>

#include <math.h>
#include <string.h>

#include <DR_HAL/DR_HAL.h>
#include <DR_Param/DR_Param.h>

const DR_HAL::HAL& hal = DR_HAL::get_HAL();

class ParamChild
{
public:
    ParamChild() {
        DR_Param::setup_object_defaults(this, var_info);
    }

    static const struct DR_Param::GroupInfo var_info[];

    DR_Int8  enable;
    DR_Int16 count;
    DR_Int32 big;
    DR_Float gain;
};

const DR_Param::GroupInfo ParamChild::var_info[] = {
    DR_GROUPINFO("ENABLE", 1, ParamChild, enable, 1),
    DR_GROUPINFO("COUNT",  2, ParamChild, count, -250),
    DR_GROUPINFO("BIG",    3, ParamChild, big, 100000),
    DR_GROUPINFO("GAIN",   4, ParamChild, gain, 0.5f),
    DR_GROUPEND
};

class ParamParent
{
public:
    ParamParent() {
        DR_Param::setup_object_defaults(this, var_info);
    }

    static const struct DR_Param::GroupInfo var_info[];

    DR_Float rate;
    ParamChild child;
};

const DR_Param::GroupInfo ParamParent::var_info[] = {
    DR_GROUPINFO("RATE", 1, ParamParent, rate, 2.5f),
    DR_SUBGROUPINFO(child, "CH_", 2, ParamParent, ParamChild),
    DR_GROUPEND
};

static DR_Int16 format_version;
static ParamParent parent;

static const DR_Param::Info var_info[] = {
    DR_VARINFO_SCALAR(format_version, "FORMAT_VERSION", 12),
    DR_VARINFO_OBJECT(parent, "PAR_", ParamParent),
    DR_VAREND
};

static DR_Param param_loader(var_info);

class DR_ParamTest : public ::testing::Test
{
protected:
    void SetUp() override {
        DR_Param::load_defaults();
    }
};

TEST_F(DR_ParamTest, ObjectDefaults)
{
    EXPECT_TRUE(DR_Param::initialised());
    EXPECT_EQ(parent.child.enable.get(), 1);
    EXPECT_EQ(parent.child.count.get(), -250);
    EXPECT_EQ(parent.child.big.get(), 100000);
    EXPECT_FLOAT_EQ(parent.child.gain, 0.5f);
    EXPECT_FLOAT_EQ(parent.rate, 2.5f);
    EXPECT_EQ(format_version.get(), 12);
}

TEST_F(DR_ParamTest, LoadDefaults)
{
    parent.child.gain.set(7.0f);
    format_version.set(3);
    DR_Param::load_defaults();
    EXPECT_FLOAT_EQ(parent.child.gain, 0.5f);
    EXPECT_EQ(format_version.get(), 12);
}

TEST_F(DR_ParamTest, FindByFullName)
{
    enum dr_var_type type = DR_PARAM_NONE;
    EXPECT_EQ(DR_Param::find("PAR_CH_GAIN", &type), &parent.child.gain);
    EXPECT_EQ(type, DR_PARAM_FLOAT);
    EXPECT_EQ(DR_Param::find("PAR_RATE", &type), &parent.rate);
    EXPECT_EQ(DR_Param::find("PAR_CH_COUNT", &type), &parent.child.count);
    EXPECT_EQ(type, DR_PARAM_INT16);
    EXPECT_EQ(DR_Param::find("FORMAT_VERSION", &type), &format_version);

    // names are not case sensitive
    EXPECT_EQ(DR_Param::find("par_ch_enable", &type), &parent.child.enable);
    EXPECT_EQ(type, DR_PARAM_INT8);
}

TEST_F(DR_ParamTest, UnknownNames)
{
    enum dr_var_type type;
    EXPECT_EQ(DR_Param::find("PAR_CH_GAINS", &type), nullptr);
    EXPECT_EQ(DR_Param::find("CH_GAIN", &type), nullptr);
    EXPECT_EQ(DR_Param::find("PAR_", &type), nullptr);
    EXPECT_EQ(DR_Param::find("", &type), nullptr);
    EXPECT_FALSE(DR_Param::set_by_name("NO_SUCH_PARAM", 1));
    float value;
    EXPECT_FALSE(DR_Param::get("NO_SUCH_PARAM", value));
}

TEST_F(DR_ParamTest, SetAndGetByName)
{
    ASSERT_TRUE(DR_Param::set_by_name("PAR_CH_GAIN", 0.125f));
    EXPECT_FLOAT_EQ(parent.child.gain, 0.125f);

    float value = 0;
    ASSERT_TRUE(DR_Param::get("PAR_CH_GAIN", value));
    EXPECT_FLOAT_EQ(value, 0.125f);

    ASSERT_TRUE(DR_Param::set_by_name("PAR_CH_BIG", -70000));
    EXPECT_EQ(parent.child.big.get(), -70000);
    ASSERT_TRUE(DR_Param::get("PAR_CH_BIG", value));
    EXPECT_FLOAT_EQ(value, -70000);
}

TEST_F(DR_ParamTest, IntegersAreRounded)
{
    ASSERT_TRUE(DR_Param::set_by_name("PAR_CH_ENABLE", 2.6f));
    EXPECT_EQ(parent.child.enable.get(), 3);
    ASSERT_TRUE(DR_Param::set_by_name("PAR_CH_ENABLE", -2.6f));
    EXPECT_EQ(parent.child.enable.get(), -3);
    ASSERT_TRUE(DR_Param::set_by_name("PAR_CH_COUNT", 1.4f));
    EXPECT_EQ(parent.child.count.get(), 1);
}

TEST_F(DR_ParamTest, OutOfRangeAndNanIgnored)
{
    ASSERT_TRUE(DR_Param::set_by_name("PAR_CH_ENABLE", 300));
    EXPECT_EQ(parent.child.enable.get(), 1);
    ASSERT_TRUE(DR_Param::set_by_name("PAR_CH_COUNT", 40000));
    EXPECT_EQ(parent.child.count.get(), -250);
    ASSERT_TRUE(DR_Param::set_by_name("PAR_CH_GAIN", NAN));
    EXPECT_FLOAT_EQ(parent.child.gain, 0.5f);
    ASSERT_TRUE(DR_Param::set_by_name("PAR_CH_GAIN", INFINITY));
    EXPECT_FLOAT_EQ(parent.child.gain, 0.5f);
}

static uint8_t num_visited;
static bool saw_child_count;

static void count_param(const char *name, float value, enum dr_var_type type)
{
    num_visited++;
    if (strcmp(name, "PAR_CH_COUNT") == 0 && type == DR_PARAM_INT16 && value == -250) {
        saw_child_count = true;
    }
}

TEST_F(DR_ParamTest, ShowAll)
{
    num_visited = 0;
    saw_child_count = false;
    DR_Param::show_all(count_param);
    EXPECT_EQ(num_visited, 6U);
    EXPECT_TRUE(saw_child_count);
}

static DR_Int8 unused_param;
static const DR_Param::Info bad_var_info[] = {
    DR_VARINFO_SCALAR(unused_param, "A_NAME_FAR_TOO_LONG", 0),
    DR_VAREND
};

TEST(DR_ParamDeathTest, RejectsLongNames)
{
    EXPECT_DR_PANIC(DR_Param bad_loader(bad_var_info));
}

DR_GTEST_MAIN()
