#include "fakes.hpp"
#include "heatsink_builder.hpp"
#include <unity.h>

using namespace std::chrono_literals;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

HeatsinkConfig heatsinkConfig(const TempDir& dir) {
    HeatsinkConfig config;
    config.name = "cpu";
    config.fan_path = dir.path() + "/fan/hwmon*/pwm1";
    config.sensor_paths = {dir.path() + "/thermal/thermal_zone*/temp"};
    config.min_temp = 40.0;
    config.max_temp = 60.0;
    config.temp_check_period = 250ms;
    return config;
}

}  // namespace

void setUp(void) {}

void tearDown(void) {}

void test_expand_glob_sorts_matches(void) {
    TempDir dir;
    std::string b = dir.file("zone_b/temp", "1");
    std::string a = dir.file("zone_a/temp", "1");
    std::string c = dir.file("zone_c/temp", "1");

    auto matches = HeatsinkBuilder::expandGlob(dir.path() + "/zone_*/temp");
    TEST_ASSERT_TRUE(matches.ok());
    TEST_ASSERT_EQUAL_INT(3, static_cast<int>(matches->size()));
    TEST_ASSERT_EQUAL_STRING(a.c_str(), (*matches)[0].c_str());
    TEST_ASSERT_EQUAL_STRING(b.c_str(), (*matches)[1].c_str());
    TEST_ASSERT_EQUAL_STRING(c.c_str(), (*matches)[2].c_str());
}

void test_expand_glob_without_matches(void) {
    TempDir dir;
    auto matches = HeatsinkBuilder::expandGlob(dir.path() + "/missing*");
    TEST_ASSERT_TRUE(matches.ok());
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(matches->size()));
}

void test_find_hwmon_device_by_name(void) {
    TempDir dir;
    dir.file("hwmon/hwmon0/name", "rp1_adc\n");
    std::string cpu = dir.file("hwmon/hwmon1/temp1_input", "45000\n");
    dir.file("hwmon/hwmon1/name", "  cpu_thermal \r\n");
    dir.file("hwmon/hwmon2/name", "nvme\n");
    dir.file("hwmon/other/name", "cpu_thermal\n");

    HeatsinkBuilder builder(dir.path() + "/hwmon");
    TEST_ASSERT_EQUAL_STRING(cpu.c_str(), builder.findHwmonDeviceByName("cpu_thermal").c_str());
    // Listed but without a temperature input
    TEST_ASSERT_EQUAL_STRING("", builder.findHwmonDeviceByName("nvme").c_str());
    TEST_ASSERT_EQUAL_STRING("", builder.findHwmonDeviceByName("gpu").c_str());

    HeatsinkBuilder missing(dir.path() + "/absent");
    TEST_ASSERT_EQUAL_STRING("", missing.findHwmonDeviceByName("cpu_thermal").c_str());
}

void test_build_heatsink(void) {
    TempDir dir;
    std::string fan_path = dir.file("fan/hwmon2/pwm1", "0");
    dir.file("thermal/thermal_zone0/temp", "42000\n");
    dir.file("thermal/thermal_zone1/temp", "47000\n");

    ControllerConfig config;
    config.heatsinks.push_back(heatsinkConfig(dir));

    HeatsinkBuilder builder(dir.path() + "/hwmon");
    auto heatsinks = builder.build(config);
    TEST_ASSERT_TRUE(heatsinks.ok());
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(heatsinks->size()));

    ThermalController& controller = *(*heatsinks)[0];
    TEST_ASSERT_EQUAL_STRING("cpu", controller.name().c_str());
    TEST_ASSERT_TRUE(controller.checkPeriod() == 250ms);

    // Closing the fan leaves it at full speed
    TEST_ASSERT_TRUE(controller.stop().ok());
    TEST_ASSERT_EQUAL_STRING("255", readFile(fan_path).c_str());
}

void test_build_heatsink_with_speed_values(void) {
    TempDir dir;
    std::string fan_path = dir.file("fan/hwmon2/pwm1", "0");
    dir.file("thermal/thermal_zone0/temp", "42000\n");

    HeatsinkConfig heatsink = heatsinkConfig(dir);
    heatsink.name.clear();
    heatsink.fan_name = "case";
    heatsink.max_speed_value = "176";
    heatsink.pwm_period = 10ms;

    auto controller = HeatsinkBuilder(dir.path() + "/hwmon").buildHeatsink(heatsink);
    TEST_ASSERT_TRUE(controller.ok());
    TEST_ASSERT_EQUAL_STRING("heatsink/case", (*controller)->name().c_str());

    TEST_ASSERT_TRUE((*controller)->stop().ok());
    TEST_ASSERT_EQUAL_STRING("176", readFile(fan_path).c_str());
}

void test_sub_millisecond_check_period(void) {
    TempDir dir;
    dir.file("fan/hwmon2/pwm1", "0");
    dir.file("thermal/thermal_zone0/temp", "42000\n");

    HeatsinkConfig heatsink = heatsinkConfig(dir);
    heatsink.temp_check_period = 500us;

    auto controller = HeatsinkBuilder(dir.path() + "/hwmon").buildHeatsink(heatsink);
    TEST_ASSERT_TRUE(controller.ok());
    TEST_ASSERT_TRUE((*controller)->checkPeriod() == 500us);
    TEST_ASSERT_TRUE((*controller)->stop().ok());
}

void test_build_heatsink_from_hwmon_names(void) {
    TempDir dir;
    dir.file("fan/hwmon2/pwm1", "0");
    dir.file("hwmon/hwmon0/name", "cpu_thermal\n");
    dir.file("hwmon/hwmon0/temp1_input", "45000\n");

    HeatsinkConfig heatsink = heatsinkConfig(dir);
    heatsink.sensor_paths.clear();
    heatsink.sensor_hwmon_names = {"cpu_thermal"};

    auto controller = HeatsinkBuilder(dir.path() + "/hwmon").buildHeatsink(heatsink);
    TEST_ASSERT_TRUE(controller.ok());
    TEST_ASSERT_TRUE((*controller)->stop().ok());

    heatsink.sensor_hwmon_names = {"gpu"};
    controller = HeatsinkBuilder(dir.path() + "/hwmon").buildHeatsink(heatsink);
    TEST_ASSERT_FALSE(controller.ok());
    TEST_ASSERT_TRUE(controller.status().code() == StatusCode::kNotFound);
}

void test_fan_glob_must_match_once(void) {
    TempDir dir;
    dir.file("thermal/thermal_zone0/temp", "42000\n");

    ControllerConfig config;
    config.heatsinks.push_back(heatsinkConfig(dir));
    HeatsinkBuilder builder(dir.path() + "/hwmon");

    auto heatsinks = builder.build(config);
    TEST_ASSERT_FALSE(heatsinks.ok());
    TEST_ASSERT_TRUE(heatsinks.status().code() == StatusCode::kNotFound);

    dir.file("fan/hwmon2/pwm1", "0");
    dir.file("fan/hwmon3/pwm1", "0");
    heatsinks = builder.build(config);
    TEST_ASSERT_FALSE(heatsinks.ok());
    TEST_ASSERT_TRUE(heatsinks.status().code() == StatusCode::kInvalidArgument);
    const std::string& glob = config.heatsinks[0].fan_path;
    std::string expected = "heatsink 'cpu': failed to create fan '" + glob + "': '" + glob +
                           "': too many matches for the given glob";
    TEST_ASSERT_EQUAL_STRING(expected.c_str(), heatsinks.status().message().c_str());
}

void test_sensor_globs_must_match(void) {
    TempDir dir;
    dir.file("fan/hwmon2/pwm1", "0");

    HeatsinkConfig heatsink = heatsinkConfig(dir);
    auto controller = HeatsinkBuilder(dir.path() + "/hwmon").buildHeatsink(heatsink);
    TEST_ASSERT_FALSE(controller.ok());
    TEST_ASSERT_TRUE(controller.status().code() == StatusCode::kNotFound);
    std::string expected = "failed to create all sensors: [" + heatsink.sensor_paths[0] +
                           "]: no file matches for the given glob(s)";
    TEST_ASSERT_EQUAL_STRING(expected.c_str(), controller.status().message().c_str());
}

void test_invalid_temperatures_fail_the_build(void) {
    TempDir dir;
    dir.file("fan/hwmon2/pwm1", "0");
    dir.file("thermal/thermal_zone0/temp", "42000\n");

    HeatsinkConfig heatsink = heatsinkConfig(dir);
    heatsink.min_temp = 60.0;

    auto controller = HeatsinkBuilder(dir.path() + "/hwmon").buildHeatsink(heatsink);
    TEST_ASSERT_FALSE(controller.ok());
    TEST_ASSERT_TRUE(controller.status().code() == StatusCode::kInvalidArgument);
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_expand_glob_sorts_matches);
    RUN_TEST(test_expand_glob_without_matches);
    RUN_TEST(test_find_hwmon_device_by_name);
    RUN_TEST(test_build_heatsink);
    RUN_TEST(test_build_heatsink_with_speed_values);
    RUN_TEST(test_sub_millisecond_check_period);
    RUN_TEST(test_build_heatsink_from_hwmon_names);
    RUN_TEST(test_fan_glob_must_match_once);
    RUN_TEST(test_sensor_globs_must_match);
    RUN_TEST(test_invalid_temperatures_fail_the_build);

    return UNITY_END();
}
