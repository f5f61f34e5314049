#include "../framework/test_framework.hpp"
#include "jalali/functions/settings.hpp"

using namespace jalali;
using namespace jalali::functions;
using namespace jalali::test;

namespace {

Result<EngineSettings> settings_from(StringView text) {
    auto cfg = config::parse_config(text);
    JALALI_THROW_IF_ERROR(cfg);
    return EngineSettings::from_config(cfg.value());
}

} // anonymous namespace

void test_defaults() {
    auto settings = settings_from("");
    ASSERT_OK(settings);
    ASSERT_EQ(settings.value().leap_rule, "arithmetic-33");
    ASSERT_FALSE(settings.value().anchor_day.has_value());
    ASSERT_TRUE(settings.value().log_level == logging::LogLevel::WARN);
    ASSERT_FALSE(settings.value().log_file.has_value());
    ASSERT_OK(settings.value().make_rule());
}

void test_recognized_keys() {
    auto settings = settings_from(R"(
[calendar]
leap_rule = Arithmetic-33

[period]
anchor_day = 25

[logging]
level = debug
file = /tmp/jalali-engine.log
)");
    ASSERT_OK(settings);
    ASSERT_EQ(settings.value().leap_rule, "arithmetic-33");
    ASSERT_EQ(settings.value().anchor_day.value(), 25);
    ASSERT_TRUE(settings.value().log_level == logging::LogLevel::DBG);
    ASSERT_EQ(settings.value().log_file.value().string(), "/tmp/jalali-engine.log");
    ASSERT_TRUE(settings.value().to_string().find("anchor_day=25") != String::npos);
}

void test_log_file_expands_environment() {
    ASSERT_OK(config::set_env("JALALI_TEST_LOG_DIR", "/var/tmp"));
    auto settings = settings_from("[logging]\nfile = ${JALALI_TEST_LOG_DIR}/engine.log\n");
    ASSERT_OK(settings);
    ASSERT_EQ(settings.value().log_file.value().string(), "/var/tmp/engine.log");
    ASSERT_OK(config::unset_env("JALALI_TEST_LOG_DIR"));
}

void test_invalid_values() {
    ASSERT_ERROR_CODE(settings_from("[calendar]\nleap_rule = astronomical\n"), ErrorCode::INVALID_ARGUMENT);
    ASSERT_ERROR_CODE(settings_from("[period]\nanchor_day = 0\n"), ErrorCode::INVALID_ARGUMENT);
    ASSERT_ERROR_CODE(settings_from("[period]\nanchor_day = 32\n"), ErrorCode::INVALID_ARGUMENT);
    ASSERT_ERROR_CODE(settings_from("[period]\nanchor_day = last\n"), ErrorCode::INVALID_ARGUMENT);
    ASSERT_ERROR_CODE(settings_from("[logging]\nlevel = loud\n"), ErrorCode::INVALID_ARGUMENT);
    
    auto error = settings_from("[period]\nanchor_day = 32\n");
    ASSERT_EQ(error.error().input(), "32");
    ASSERT_EQ(error.error().component, "settings");
    ASSERT_TRUE(error.error().message.find("anchor_day") != String::npos);
}

int main() {
    TestSuite suite("Engine Settings Tests");
    
    suite.add_test("Defaults", test_defaults);
    suite.add_test("Recognized Keys", test_recognized_keys);
    suite.add_test("Log File Expands Environment", test_log_file_expands_environment);
    suite.add_test("Invalid Values", test_invalid_values);
    
    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
