#include <gtest/gtest.h>
#include "fakes.hpp"
#include "../src/feeds.hpp"
#include "../src/localization.hpp"

namespace {

const std::string UPDATES_XML = R"xml(<?xml version="1.0" encoding="UTF-8"?>
<products>
  <product name="IntelliJ IDEA">
    <code>IIU</code>
    <code>IU</code>
    <channel id="IC-IU-EAP-licensing-EAP" name="IntelliJ IDEA EAP" status="eap">
      <build number="252.100" version="2025.2" releaseDate="20250601"/>
    </channel>
    <channel id="IC-IU-RELEASE-licensing-RELEASE" name="IntelliJ IDEA RELEASE" status="release">
      <build number="251.23774" version="2025.1.1" fullNumber="251.23774.435"/>
      <build number="243.26053" version="2024.3.5" fullNumber=""/>
      <build number="242.1" version="2024.2.5"/>
    </channel>
  </product>
  <product name="IntelliJ IDEA Ultimate (duplicate listing)">
    <code>IU</code>
    <channel id="IU-RELEASE-licensing-RELEASE" status="release">
      <build number="251.1" version="2025.1"/>
    </channel>
  </product>
  <product name="Fleet">
    <code>FL</code>
    <channel id="FL-RELEASE-licensing-RELEASE" status="release">
      <build number="1.48" version="2025.1"/>
    </channel>
  </product>
  <product name="Rider">
    <code>RD</code>
    <channel id="RD-RELEASE-licensing-RELEASE" status="release">
      <build number="251.25410" version="2025.1.2" fullNumber="251.25410.119"/>
    </channel>
  </product>
</products>
)xml";

const std::string ANDROID_JSON = R"({
  "content": {
    "item": [
      {"name": "Android Studio Narwhal | 2025.1.1", "build": "AI-251.25410.109.2511.13665796",
       "version": "2025.1.1", "channel": "Release", "platformBuild": "251.25410.109"},
      {"name": "Android Studio Ladybug | 2024.2.1", "build": "AI-242.23339.11.2421.12483815",
       "version": "2024.2.1", "channel": "Release", "platformBuild": "242.23339.11"},
      {"name": "Android Studio Narwhal Feature Drop | 2025.1.2 Canary 1", "build": "AI-251.26094.121.2512.13699665",
       "version": "2025.1.2", "channel": "Canary", "platformBuild": "251.26094.121"}
    ]
  }
})";

} // namespace

class FeedsTest : public ::testing::Test {
protected:
    Config config;

    void SetUp() override {
        init_localization();
    }
};

TEST_F(FeedsTest, PluginDetails) {
    auto releases = parse_plugin_details(R"(<plugin-repository>
  <category name="Languages">
    <idea-plugin><version> 0.4.200 </version><idea-version since-build="243.1" until-build="251.*"/></idea-plugin>
    <idea-plugin><version>0.4.100</version><idea-version since-build="" until-build=""/></idea-plugin>
    <idea-plugin><version>0.3</version></idea-plugin>
  </category>
</plugin-repository>)");

    ASSERT_TRUE(releases.has_value());
    ASSERT_EQ(releases->size(), 3u);
    EXPECT_EQ((*releases)[0].version, "0.4.200");
    EXPECT_EQ((*releases)[0].since_build, "243.1");
    EXPECT_EQ((*releases)[0].until_build, "251.*");
    EXPECT_EQ((*releases)[1].version, "0.4.100");
    EXPECT_FALSE((*releases)[1].since_build.has_value());
    EXPECT_FALSE((*releases)[1].until_build.has_value());
    EXPECT_FALSE((*releases)[2].since_build.has_value());
}

TEST_F(FeedsTest, PluginDetailsWithoutCategory) {
    EXPECT_FALSE(parse_plugin_details("<plugin-repository><ff>x</ff></plugin-repository>").has_value());
}

TEST_F(FeedsTest, PluginDetailsEmptyCategory) {
    auto releases = parse_plugin_details("<plugin-repository><category name=\"x\"/></plugin-repository>");
    ASSERT_TRUE(releases.has_value());
    EXPECT_TRUE(releases->empty());
}

TEST_F(FeedsTest, PluginDetailsErrors) {
    EXPECT_THROW(parse_plugin_details("not xml at all"), PlugdbException);
    EXPECT_THROW(parse_plugin_details(""), PlugdbException);
    EXPECT_THROW(parse_plugin_details("<r><category><idea-plugin/></category></r>"), PlugdbException);
}

TEST_F(FeedsTest, JetBrainsUpdates) {
    auto ides = parse_jetbrains_updates(UPDATES_XML, config);

    ASSERT_EQ(ides.size(), 3u);
    EXPECT_EQ(ides[0], (IdeIdentity{IdeProduct::IntelliJIdea, "2025.1.1", ""}));
    EXPECT_EQ(ides[0].build_number, "251.23774.435");
    EXPECT_EQ(ides[1], (IdeIdentity{IdeProduct::IntelliJIdea, "2024.3.5", ""}));
    EXPECT_EQ(ides[1].build_number, "243.26053");
    EXPECT_EQ(ides[2], (IdeIdentity{IdeProduct::Rider, "2025.1.2", ""}));
    EXPECT_EQ(ides[2].build_number, "251.25410.119");
}

TEST_F(FeedsTest, JetBrainsUpdatesVersionPrefixes) {
    config.version_prefixes = {"2024."};
    auto ides = parse_jetbrains_updates(UPDATES_XML, config);
    ASSERT_EQ(ides.size(), 2u);
    EXPECT_EQ(ides[0].version, "2024.3.5");
    EXPECT_EQ(ides[1].version, "2024.2.5");
}

TEST_F(FeedsTest, JetBrainsUpdatesMissingAttributes) {
    const std::string xml = R"(<products><product><code>CL</code>
<channel id="CL-RELEASE-licensing-RELEASE"><build version="2025.1"/></channel></product></products>)";
    EXPECT_THROW(parse_jetbrains_updates(xml, config), PlugdbException);
}

TEST_F(FeedsTest, AndroidStudioReleases) {
    auto ides = parse_android_studio_releases(ANDROID_JSON, config);

    ASSERT_EQ(ides.size(), 2u);
    EXPECT_EQ(ides[0].product, IdeProduct::AndroidStudio);
    EXPECT_EQ(ides[0].version, "2025.1.1");
    EXPECT_EQ(ides[0].build_number, "251.25410.109");
    EXPECT_EQ(ides[1].version, "2025.1.2");
    EXPECT_EQ(ides[1].to_json_filename(), "android-studio-2025.1.2.json");
}

TEST_F(FeedsTest, AndroidStudioUnexpectedBuild) {
    const std::string json = R"({"content": {"item": [
        {"build": "IC-251.1", "version": "2025.1", "platformBuild": "251.1"}]}})";
    EXPECT_THROW(parse_android_studio_releases(json, config), PlugdbException);
    EXPECT_THROW(parse_android_studio_releases(R"({"content": {}})", config), PlugdbException);
    EXPECT_THROW(parse_android_studio_releases("[", config), PlugdbException);
}

TEST_F(FeedsTest, PluginIndex) {
    EXPECT_EQ(parse_plugin_index(R"(["org.rust.lang", "com.intellij.kubernetes"])"),
              (std::vector<std::string>{"org.rust.lang", "com.intellij.kubernetes"}));
    EXPECT_TRUE(parse_plugin_index("[]").empty());
    EXPECT_THROW(parse_plugin_index(R"({"a": 1})"), PlugdbException);
    EXPECT_THROW(parse_plugin_index("[1, 2]"), PlugdbException);
}

TEST_F(FeedsTest, CollectIdes) {
    FakeHttpClient http;
    http.on_get(config.jetbrains_updates_url, HttpResponse{200, UPDATES_XML, ""});
    http.on_get(config.android_studio_releases_url, HttpResponse{200, ANDROID_JSON, ""});

    auto ides = collect_ides(config, http);
    ASSERT_EQ(ides.size(), 5u);
    EXPECT_EQ(ides[0].product, IdeProduct::IntelliJIdea);
    EXPECT_EQ(ides[4].product, IdeProduct::AndroidStudio);
}

TEST_F(FeedsTest, CollectIdesFeedUnavailable) {
    FakeHttpClient http;
    http.on_get(config.jetbrains_updates_url, HttpResponse{200, UPDATES_XML, ""});
    EXPECT_THROW(collect_ides(config, http), PlugdbException);
}

TEST_F(FeedsTest, FetchPluginIndex) {
    FakeHttpClient http;
    http.on_get(config.plugin_indices[0], HttpResponse{200, R"(["a", "b"])", ""});
    EXPECT_EQ(fetch_plugin_index(config.plugin_indices[0], http), (std::vector<std::string>{"a", "b"}));
    EXPECT_THROW(fetch_plugin_index(config.plugin_indices[1], http), PlugdbException);
}

TEST(IdeTest, ProductCodes) {
    EXPECT_EQ(product_from_code("IU"), IdeProduct::IntelliJIdea);
    EXPECT_EQ(product_from_code("WRS"), IdeProduct::Writerside);
    EXPECT_FALSE(product_from_code("IC").has_value());
    EXPECT_EQ(product_code(IdeProduct::RustRover), "RR");
    EXPECT_EQ(product_key(IdeProduct::RubyMine), "ruby-mine");
    EXPECT_EQ(product_from_key("android-studio"), IdeProduct::AndroidStudio);
}

TEST(IdeTest, JsonFilenames) {
    const IdeIdentity rover{IdeProduct::RustRover, "2025.1.3", "251.1"};
    EXPECT_EQ(rover.to_json_filename(), "rust-rover-2025.1.3.json");

    auto parsed = IdeIdentity::from_json_filename("rust-rover-2025.1.3.json");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, rover);
    EXPECT_TRUE(parsed->build_number.empty());

    EXPECT_EQ(IdeIdentity::from_json_filename("idea-2024.3.json")->product, IdeProduct::IntelliJIdea);
    EXPECT_FALSE(IdeIdentity::from_json_filename("idea-2024.3.txt").has_value());
    EXPECT_FALSE(IdeIdentity::from_json_filename("notepad-1.0.json").has_value());
    EXPECT_FALSE(IdeIdentity::from_json_filename("idea-.json").has_value());
    EXPECT_FALSE(IdeIdentity::from_json_filename("idea.json").has_value());
}

TEST(IdeTest, IdentityIgnoresBuildNumber) {
    const IdeIdentity a{IdeProduct::GoLand, "2025.1", "251.1"};
    const IdeIdentity b{IdeProduct::GoLand, "2025.1", ""};
    EXPECT_EQ(a, b);
    EXPECT_EQ(IdeIdentityHash{}(a), IdeIdentityHash{}(b));
    EXPECT_TRUE((IdeIdentity{IdeProduct::GoLand, "2024.3", ""} < a));
}
