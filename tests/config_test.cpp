//! # Configuration Tests
//!
//! The TOML subset reader and `CardConfig` parsing, validation and
//! conversion.

#include "config/card_config.hpp"
#include "config/toml_reader.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace pjsk;
using namespace pjsk::config;
namespace fs = std::filesystem;

namespace {

auto parse_doc(const std::string& content) -> std::optional<TomlDocument> {
    SimpleTomlParser parser(content);
    auto doc = parser.parse();
    if (!doc) {
        ADD_FAILURE() << parser.get_error();
    }
    return doc;
}

auto parse_error(const std::string& content) -> std::string {
    SimpleTomlParser parser(content);
    EXPECT_FALSE(parser.parse().has_value());
    return parser.get_error();
}

auto parse_config(const std::string& content) -> CardConfig {
    auto parsed = CardConfig::parse(content);
    if (is_err(parsed)) {
        ADD_FAILURE() << unwrap_err(parsed).message;
        return CardConfig{};
    }
    return std::move(unwrap(parsed));
}

} // namespace

// ============================================================================
// SimpleTomlParser
// ============================================================================

TEST(TomlReaderTest, ScalarsAndSections) {
    auto doc = parse_doc(R"(
top = "root"   # comment

[limits]
font_size_min = 18
line_spacing_min = 0.6
offset_min = -240
big = 1_000

[messaging]
show_success_messages = false
)");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(std::get<std::string>(doc->table("")->find("top")->value), "root");

    const auto* limits = doc->table("limits");
    ASSERT_NE(limits, nullptr);
    EXPECT_EQ(std::get<long long>(limits->find("font_size_min")->value), 18);
    EXPECT_DOUBLE_EQ(std::get<double>(limits->find("line_spacing_min")->value), 0.6);
    EXPECT_EQ(std::get<long long>(limits->find("offset_min")->value), -240);
    EXPECT_EQ(std::get<long long>(limits->find("big")->value), 1000);
    EXPECT_EQ(limits->find("font_size_min")->line, 5);

    EXPECT_FALSE(std::get<bool>(doc->table("messaging")->find("show_success_messages")->value));
    EXPECT_EQ(doc->table("missing"), nullptr);
}

TEST(TomlReaderTest, QuotedKeysAndMultiLineArrays) {
    auto doc = parse_doc(R"([groups]
"Leo/need" = [
    "星乃一歌",  # vocals
    "天马咲希",
]
"Vivid BAD SQUAD" = ["东云彰人", "青柳冬弥"]
)");
    ASSERT_TRUE(doc.has_value());
    const auto* groups = doc->table("groups");
    ASSERT_EQ(groups->entries.size(), 2u);
    EXPECT_EQ(groups->entries[0].key, "Leo/need");
    auto members = std::get<std::vector<std::string>>(groups->entries[0].value);
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[1], "天马咲希");
}

TEST(TomlReaderTest, StringEscapes) {
    auto doc = parse_doc(R"(text = "a\tb \"q\" \\")");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(std::get<std::string>(doc->table("")->find("text")->value), "a\tb \"q\" \\");
}

TEST(TomlReaderTest, RepeatedSectionsMerge) {
    auto doc = parse_doc("[a]\nx = 1\n[b]\ny = 2\n[a]\nz = 3\n");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->tables.size(), 3u);
    EXPECT_EQ(doc->table("a")->entries.size(), 2u);
}

TEST(TomlReaderTest, ErrorsNameTheLine) {
    EXPECT_EQ(parse_error("[a]\nx = 1\nx = 2\n"), "Line 3: Duplicate key 'x'");
    EXPECT_EQ(parse_error("\n\nname = \"open\n").rfind("Line 3:", 0), 0u);
    EXPECT_EQ(parse_error("x = maybe\n"), "Line 1: Expected value, found 'maybe'");
    EXPECT_EQ(parse_error("x = 1 2\n"), "Line 1: Unexpected content after value");
    EXPECT_EQ(parse_error("x 1\n"), "Line 1: Expected '=' after key");
    EXPECT_FALSE(parse_error("x = [1, 2]\n").empty());
    EXPECT_FALSE(parse_error("[a\nx = 1\n").empty());
}

TEST(TomlReaderTest, TypeNames) {
    EXPECT_STREQ(toml_type_name(TomlValue(std::string("s"))), "string");
    EXPECT_STREQ(toml_type_name(TomlValue(1LL)), "integer");
    EXPECT_STREQ(toml_type_name(TomlValue(1.0)), "float");
    EXPECT_STREQ(toml_type_name(TomlValue(true)), "boolean");
    EXPECT_STREQ(toml_type_name(TomlValue(std::vector<std::string>{})), "array");
}

// ============================================================================
// CardConfig
// ============================================================================

TEST(CardConfigTest, DefaultsAreValid) {
    CardConfig config;
    EXPECT_FALSE(config.validate().has_value());
    EXPECT_EQ(config.personas.size(), 8u);
    EXPECT_EQ(config.groups.size(), 4u);
    EXPECT_EQ(config.persistence.storage_path, "data/pjsk_states.json");
}

TEST(CardConfigTest, EmptyDocumentKeepsDefaults) {
    auto config = parse_config("");
    EXPECT_EQ(config.limits.font_size_max, 84);
    EXPECT_EQ(config.defaults.role, "初音未来");
    EXPECT_TRUE(config.messaging.show_success_messages);
}

TEST(CardConfigTest, ReadsEverySection) {
    auto config = parse_config(R"(
[messaging]
show_success_messages = false
mention_user_on_render = true
selection_timeout_seconds = 45

[render]
adaptive_text_sizing = false
default_curve_intensity = 0.8
enable_text_shadow = false
default_emoji_set = "google"

[persistence]
enabled = false
state_ttl_hours = 2.5
storage_path = "/tmp/cards.json"

[logging]
level = "debug"
file = "pjsk.log"

[limits]
font_size_min = 20
font_size_max = 80
offset_step = 10
line_spacing_step = 0.2
max_text_length = 60

[defaults]
text = "hello"
font_size = 40
line_spacing = 1
)");
    EXPECT_FALSE(config.messaging.show_success_messages);
    EXPECT_TRUE(config.messaging.mention_user_on_render);
    EXPECT_DOUBLE_EQ(config.messaging.selection_timeout_seconds, 45.0);
    EXPECT_FALSE(config.render.adaptive_text_sizing);
    EXPECT_DOUBLE_EQ(config.render.default_curve_intensity, 0.8);
    EXPECT_EQ(config.render.default_emoji_set, "google");
    EXPECT_FALSE(config.persistence.enabled);
    EXPECT_DOUBLE_EQ(config.persistence.state_ttl_hours, 2.5);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.file, "pjsk.log");
    EXPECT_EQ(config.limits.font_size_min, 20);
    EXPECT_EQ(config.limits.offset_step, 10);
    EXPECT_DOUBLE_EQ(config.limits.line_spacing_step, 0.2);
    EXPECT_EQ(config.limits.max_text_length, 60u);
    EXPECT_EQ(config.defaults.text, "hello");
    EXPECT_DOUBLE_EQ(config.defaults.line_spacing, 1.0);
    EXPECT_FALSE(config.validate().has_value());

    auto settings = config.coordinator_settings();
    EXPECT_FALSE(settings.show_success_messages);
    EXPECT_TRUE(settings.mention_user_on_render);
    EXPECT_FALSE(settings.persistence_enabled);
    EXPECT_DOUBLE_EQ(settings.curve_intensity, 0.8);
    EXPECT_FALSE(settings.shadow_enabled);
    EXPECT_EQ(settings.limits.font_size_max, 80);
    EXPECT_EQ(settings.defaults.font_size, 40);
    EXPECT_DOUBLE_EQ(settings.selection_timeout_seconds, 45.0);
}

TEST(CardConfigTest, TypeErrorsNameKeyAndLine) {
    auto parsed = CardConfig::parse("[limits]\nfont_size_min = \"small\"\n");
    ASSERT_TRUE(is_err(parsed));
    EXPECT_EQ(unwrap_err(parsed).message,
              "Line 2: [limits] font_size_min must be an integer, found string");

    auto negative = CardConfig::parse("[limits]\nmax_text_length = -1\n");
    ASSERT_TRUE(is_err(negative));
    EXPECT_NE(unwrap_err(negative).message.find("must not be negative"), std::string::npos);
}

TEST(CardConfigTest, SyntaxErrorsPassThrough) {
    auto parsed = CardConfig::parse("[limits\n");
    ASSERT_TRUE(is_err(parsed));
    EXPECT_EQ(unwrap_err(parsed).message.rfind("Line 1:", 0), 0u);
}

TEST(CardConfigTest, PersonasAndGroupsReplaceBuiltins) {
    auto config = parse_config(R"(
[defaults]
role = "Alpha"

[personas]
"Alpha" = ["a", "first"]
"Beta" = ["b"]

[groups]
"Duo" = ["Alpha", "Beta"]
)");
    ASSERT_EQ(config.personas.size(), 2u);
    EXPECT_EQ(config.personas[0].name, "Alpha");
    ASSERT_EQ(config.groups.size(), 1u);
    EXPECT_FALSE(config.validate().has_value());

    auto catalog = config.build_catalog();
    ASSERT_TRUE(is_ok(catalog));
    EXPECT_EQ(unwrap(catalog).resolve("FIRST"), "Alpha");
    EXPECT_EQ(unwrap(catalog).group_of("Beta"), "Duo");
}

TEST(CardConfigTest, PersonaValuesMustBeArrays) {
    auto parsed = CardConfig::parse("[personas]\n\"Alpha\" = \"a\"\n");
    ASSERT_TRUE(is_err(parsed));
    EXPECT_NE(unwrap_err(parsed).message.find("must be an array of strings"), std::string::npos);
}

TEST(CardConfigTest, AmbiguousPersonaAliasFailsCatalogBuild) {
    auto config = parse_config(R"(
[defaults]
role = "Alpha"

[personas]
"Alpha" = ["x"]
"Beta" = ["X"]
)");
    EXPECT_TRUE(is_err(config.build_catalog()));
}

TEST(CardConfigTest, ValidationRules) {
    auto invalid = [](auto mutate) {
        CardConfig config;
        mutate(config);
        return config.validate().has_value();
    };

    EXPECT_TRUE(invalid([](CardConfig& c) { c.limits.font_size_min = 100; }));
    EXPECT_TRUE(invalid([](CardConfig& c) { c.limits.line_spacing_step = 0.0; }));
    EXPECT_TRUE(invalid([](CardConfig& c) { c.defaults.font_size = 10; }));
    EXPECT_TRUE(invalid([](CardConfig& c) { c.defaults.line_spacing = 5.0; }));
    EXPECT_TRUE(invalid([](CardConfig& c) { c.defaults.text = "   "; }));
    EXPECT_TRUE(invalid([](CardConfig& c) { c.defaults.text = std::string(200, 'a'); }));
    EXPECT_TRUE(invalid([](CardConfig& c) { c.personas.clear(); }));
    EXPECT_TRUE(invalid([](CardConfig& c) { c.defaults.role = "nobody"; }));
    EXPECT_TRUE(invalid([](CardConfig& c) { c.persistence.state_ttl_hours = 0; }));
    EXPECT_TRUE(invalid([](CardConfig& c) { c.persistence.storage_path.clear(); }));
    EXPECT_TRUE(invalid([](CardConfig& c) { c.messaging.selection_timeout_seconds = -1; }));
    EXPECT_TRUE(invalid([](CardConfig& c) { c.logging.level = "loud"; }));

    EXPECT_FALSE(invalid([](CardConfig& c) {
        c.persistence.enabled = false;
        c.persistence.storage_path.clear();
    }));
}

// ============================================================================
// Loading From Disk
// ============================================================================

class CardConfigFileTest : public ::testing::Test {
protected:
    fs::path path;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path = fs::temp_directory_path() / (std::string("pjsk_config_") + info->name() + ".toml");
        fs::remove(path);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& content) {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }
};

TEST_F(CardConfigFileTest, LoadMissingFileFails) {
    auto loaded = CardConfig::load(path);
    ASSERT_TRUE(is_err(loaded));
    EXPECT_EQ(unwrap_err(loaded).message.rfind("Cannot open", 0), 0u);

    auto fallback = CardConfig::load_or_default(path);
    EXPECT_EQ(fallback.limits.font_size_max, 84);
}

TEST_F(CardConfigFileTest, LoadValidatesAndPrefixesPath) {
    write("[defaults]\nfont_size = 500\n");
    auto loaded = CardConfig::load(path);
    ASSERT_TRUE(is_err(loaded));
    EXPECT_EQ(unwrap_err(loaded).message.rfind(path.string() + ": default font_size", 0), 0u);

    auto fallback = CardConfig::load_or_default(path);
    EXPECT_EQ(fallback.defaults.font_size, 42);
}

TEST_F(CardConfigFileTest, LoadGoodFile) {
    write("[limits]\noffset_step = 20\n");
    auto loaded = CardConfig::load(path);
    ASSERT_TRUE(is_ok(loaded));
    EXPECT_EQ(unwrap(loaded).limits.offset_step, 20);
}
