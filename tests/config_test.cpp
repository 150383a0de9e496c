#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "radlink/config/config.hpp"

namespace radlink::config {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("radlink_config_test_" + std::to_string(::testing::UnitTest::GetInstance()
                                                               ->random_seed()) +
                  "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".ini"))
                    .string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void write(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }

    std::optional<CliOptions> parse(std::vector<std::string> args) {
        args.insert(args.begin(), "radlink_demo");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_cli(static_cast<int>(argv.size()), argv.data());
    }

    static RadlinkConfig valid_config() {
        RadlinkConfig config;
        config.command.key.assign(32, 0x11);
        return config;
    }

    std::string path_;
};

TEST_F(ConfigTest, LoadsIniSections) {
    write(R"(
# Detector link settings
[impairment]
loss_rate = 0.05
reorder_rate = 0.1
corruption_rate = 0.01
min_delay_ms = 2
max_delay_ms = 9
seed = 1234

[fragmentation]
max_payload = 1024
timeout_ms = 250
max_pending_frames = 8

[reassembly]
slots = 6

[command]
bind_host = 0.0.0.0
port = 6000
peer = "10.1.2.3:6000"
key = 0x00ff10
max_peers = 4

[source]
rows = 64
cols = 32
bit_depth = 12
frames = 3

[logging]
level = debug
)");

    auto config = load_config(path_);
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->impairment.loss_rate, 0.05);
    EXPECT_DOUBLE_EQ(config->impairment.reorder_rate, 0.1);
    EXPECT_DOUBLE_EQ(config->impairment.corruption_rate, 0.01);
    EXPECT_EQ(config->impairment.min_delay_ms, 2u);
    EXPECT_EQ(config->impairment.max_delay_ms, 9u);
    EXPECT_EQ(config->impairment.seed, 1234u);
    EXPECT_EQ(config->fragmentation.max_payload, 1024u);
    EXPECT_EQ(config->assembler.fragment_timeout_ms, 250u);
    EXPECT_EQ(config->assembler.max_pending_frames, 8u);
    EXPECT_EQ(config->reassembly.num_slots, 6u);
    EXPECT_EQ(config->command.bind_host, "0.0.0.0");
    EXPECT_EQ(config->command.port, 6000);
    EXPECT_EQ(config->command.peer, "10.1.2.3:6000");
    EXPECT_EQ(config->command.key, (std::vector<uint8_t>{0x00, 0xFF, 0x10}));
    EXPECT_EQ(config->command.max_peers, 4u);
    EXPECT_EQ(config->source.rows, 64u);
    EXPECT_EQ(config->source.cols, 32u);
    EXPECT_EQ(config->source.bit_depth, 12);
    EXPECT_EQ(config->source.frames, 3u);
    EXPECT_EQ(config->log_level, utils::LogLevel::DEBUG);
}

TEST_F(ConfigTest, UnknownKeysIgnored) {
    write("[impairment]\nloss_rate = 0.5\nfrobnicate = 1\n[mystery]\nx = y\n");
    auto config = load_config(path_);
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->impairment.loss_rate, 0.5);
}

TEST_F(ConfigTest, BadValuesRejected) {
    write("[command]\nport = 70000\n");
    EXPECT_FALSE(load_config(path_).has_value());

    write("[impairment]\nloss_rate = lots\n");
    EXPECT_FALSE(load_config(path_).has_value());

    write("[command]\nkey = xyz\n");
    EXPECT_FALSE(load_config(path_).has_value());

    write("[source]\nrows = -4\n");
    EXPECT_FALSE(load_config(path_).has_value());
}

TEST_F(ConfigTest, MissingFile) {
    EXPECT_FALSE(load_config(path_ + ".missing").has_value());
}

TEST_F(ConfigTest, SaveThenLoad) {
    auto config = valid_config();
    config.impairment.loss_rate = 0.25;
    config.impairment.seed = 99;
    config.fragmentation.max_payload = 4096;
    config.reassembly.num_slots = 3;
    config.command.peer = "192.168.0.7:7000";
    config.source.bit_depth = 14;
    config.log_level = utils::LogLevel::WARN;

    ASSERT_TRUE(save_config(config, path_));
    auto loaded = load_config(path_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_DOUBLE_EQ(loaded->impairment.loss_rate, 0.25);
    EXPECT_EQ(loaded->impairment.seed, 99u);
    EXPECT_EQ(loaded->fragmentation.max_payload, 4096u);
    EXPECT_EQ(loaded->reassembly.num_slots, 3u);
    EXPECT_EQ(loaded->command.peer, "192.168.0.7:7000");
    EXPECT_EQ(loaded->command.key, config.command.key);
    EXPECT_EQ(loaded->source.bit_depth, 14);
    EXPECT_EQ(loaded->log_level, utils::LogLevel::WARN);
}

TEST_F(ConfigTest, MergePrefersNonDefaultOverlay) {
    RadlinkConfig base;
    base.impairment.loss_rate = 0.1;
    base.command.port = 7000;
    base.source.rows = 128;

    RadlinkConfig overlay;
    overlay.impairment.loss_rate = 0.3;
    overlay.source.cols = 64;

    auto merged = merge_config(base, overlay);
    EXPECT_DOUBLE_EQ(merged.impairment.loss_rate, 0.3);
    EXPECT_EQ(merged.command.port, 7000);
    EXPECT_EQ(merged.source.rows, 128u);
    EXPECT_EQ(merged.source.cols, 64u);
}

TEST_F(ConfigTest, Validation) {
    EXPECT_TRUE(validate_config(valid_config()).valid);

    auto no_key = valid_config();
    no_key.command.key.clear();
    EXPECT_FALSE(validate_config(no_key).valid);

    auto bad_rate = valid_config();
    bad_rate.impairment.corruption_rate = 1.5;
    EXPECT_FALSE(validate_config(bad_rate).valid);

    auto bad_delay = valid_config();
    bad_delay.impairment.min_delay_ms = 10;
    bad_delay.impairment.max_delay_ms = 5;
    EXPECT_FALSE(validate_config(bad_delay).valid);

    auto one_slot = valid_config();
    one_slot.reassembly.num_slots = 1;
    EXPECT_FALSE(validate_config(one_slot).valid);

    auto deep = valid_config();
    deep.source.bit_depth = 17;
    EXPECT_FALSE(validate_config(deep).valid);

    auto wide = valid_config();
    wide.source.cols = 40000;
    EXPECT_FALSE(validate_config(wide).valid);

    auto short_key = valid_config();
    short_key.command.key.assign(8, 0x01);
    auto result = validate_config(short_key);
    EXPECT_TRUE(result.valid);
    EXPECT_FALSE(result.warnings.empty());
}

TEST_F(ConfigTest, HexHelpers) {
    EXPECT_EQ(parse_hex("0xDEADbeef"), (std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}));
    EXPECT_EQ(parse_hex(""), std::vector<uint8_t>{});
    EXPECT_FALSE(parse_hex("abc").has_value());
    EXPECT_FALSE(parse_hex("zz").has_value());
    EXPECT_EQ(to_hex({0x01, 0xAB}), "01ab");
}

TEST_F(ConfigTest, CommandLine) {
    auto options = parse({"-m", "server", "--loss-rate", "0.2", "--slots", "8", "--key",
                          "00112233", "-l", "trace", "--bit-depth", "10"});
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->mode, "server");
    EXPECT_DOUBLE_EQ(options->overrides.impairment.loss_rate, 0.2);
    EXPECT_EQ(options->overrides.reassembly.num_slots, 8u);
    EXPECT_EQ(options->overrides.command.key, (std::vector<uint8_t>{0x00, 0x11, 0x22, 0x33}));
    EXPECT_EQ(options->overrides.log_level, utils::LogLevel::TRACE);
    EXPECT_EQ(options->overrides.source.bit_depth, 10);
}

TEST_F(ConfigTest, CommandLineRejectsBadValues) {
    EXPECT_FALSE(parse({"-m", "bogus"}).has_value());
    EXPECT_FALSE(parse({"--loss-rate", "2"}).has_value());
    EXPECT_FALSE(parse({"--key", "nothex"}).has_value());
}

}  // namespace
}  // namespace radlink::config
