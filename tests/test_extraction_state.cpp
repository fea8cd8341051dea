#include <gtest/gtest.h>

#include "extract/extraction_state.hpp"
#include "testing.hpp"

#include <nlohmann/json.hpp>

namespace arcnav {

namespace {

ExtractionState SampleState() {
    ExtractionState s;
    s.archive_identity = "/data/a.zip";
    s.base_directory = "payload/";
    s.order = {"payload/c.csv", "payload/a.csv", "payload/b.csv"};
    s.cursor = 1;
    s.batch_size = 2;
    s.seed = 123;
    s.extensions = {".csv"};
    s.failed = {"payload/a.csv"};
    s.on_error = ErrorPolicy::Abort;
    s.max_retries = 3;
    s.validate_crc = true;
    s.extract_dir = "/out/extracted_archive";
    return s;
}

} // namespace

TEST(ExtractionStateTest, SerializeUsesStableKeys) {
    const auto j = nlohmann::json::parse(ExtractionStateStore::Serialize(SampleState()));
    EXPECT_EQ(j.at("zip_path"), "/data/a.zip");
    EXPECT_EQ(j.at("base_at_init"), "payload/");
    EXPECT_EQ(j.at("cursor"), 1);
    EXPECT_EQ(j.at("batch_size"), 2);
    EXPECT_EQ(j.at("seed"), 123);
    EXPECT_EQ(j.at("on_error"), "abort");
    EXPECT_EQ(j.at("max_retries"), 3);
    EXPECT_EQ(j.at("validate_crc"), true);
    EXPECT_EQ(j.at("extract_dir"), "/out/extracted_archive");
    EXPECT_EQ(j.at("order").size(), 3u);
}

TEST(ExtractionStateTest, ParseRestoresEveryField) {
    const auto original = SampleState();
    auto parsed = ExtractionStateStore::Parse(ExtractionStateStore::Serialize(original));
    ASSERT_TRUE(parsed.has_value()) << parsed.error();

    EXPECT_EQ(parsed->archive_identity, original.archive_identity);
    EXPECT_EQ(parsed->base_directory, original.base_directory);
    EXPECT_EQ(parsed->order, original.order);
    EXPECT_EQ(parsed->cursor, original.cursor);
    EXPECT_EQ(parsed->batch_size, original.batch_size);
    EXPECT_EQ(parsed->seed, original.seed);
    EXPECT_EQ(parsed->extensions, original.extensions);
    EXPECT_EQ(parsed->failed, original.failed);
    EXPECT_EQ(parsed->on_error, ErrorPolicy::Abort);
    EXPECT_EQ(parsed->max_retries, 3);
    EXPECT_TRUE(parsed->validate_crc);
}

TEST(ExtractionStateTest, OptionalPolicyKeysDefault) {
    const char* doc = R"({"zip_path":"/a.zip","base_at_init":"","order":["x"],
                          "cursor":0,"batch_size":1,"seed":9,"extensions":null})";
    auto parsed = ExtractionStateStore::Parse(doc);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    EXPECT_TRUE(parsed->extensions.empty());
    EXPECT_TRUE(parsed->failed.empty());
    EXPECT_EQ(parsed->on_error, ErrorPolicy::Skip);
    EXPECT_EQ(parsed->max_retries, 1);
    EXPECT_FALSE(parsed->validate_crc);
}

TEST(ExtractionStateTest, ParseRejectsInconsistentDocuments) {
    EXPECT_FALSE(ExtractionStateStore::Parse("not json").has_value());
    EXPECT_FALSE(ExtractionStateStore::Parse("[]").has_value());
    EXPECT_FALSE(ExtractionStateStore::Parse(
        R"({"zip_path":"/a.zip","base_at_init":"","order":["x"],"cursor":2,"batch_size":1,"seed":1})")
                     .has_value());
    EXPECT_FALSE(ExtractionStateStore::Parse(
        R"({"zip_path":"/a.zip","base_at_init":"","order":["x"],"cursor":0,"batch_size":0,"seed":1})")
                     .has_value());
    EXPECT_FALSE(ExtractionStateStore::Parse(
        R"({"zip_path":"/a.zip","base_at_init":"","order":"x","cursor":0,"batch_size":1,"seed":1})")
                     .has_value());
    EXPECT_FALSE(ExtractionStateStore::Parse(
        R"({"zip_path":"/a.zip","base_at_init":"","order":[],"cursor":0,"batch_size":1,"seed":1,
            "on_error":"retry"})")
                     .has_value());
}

TEST(ExtractionStateTest, ParseRejectsRetryCountAboveLimit) {
    const std::string at_limit =
        R"({"zip_path":"/a.zip","base_at_init":"","order":[],"cursor":0,"batch_size":1,"seed":1,
            "max_retries":1000})";
    auto ok = ExtractionStateStore::Parse(at_limit);
    ASSERT_TRUE(ok.has_value()) << ok.error();
    EXPECT_EQ(ok->max_retries, kMaxRetriesLimit);

    auto over = ExtractionStateStore::Parse(
        R"({"zip_path":"/a.zip","base_at_init":"","order":[],"cursor":0,"batch_size":1,"seed":1,
            "max_retries":1001})");
    ASSERT_FALSE(over.has_value());
    EXPECT_NE(over.error().find("max_retries"), std::string::npos);
}

TEST(ExtractionStateTest, LoadReportsMissingAndCorruptFiles) {
    testutil::TemporaryDirectory tmp;
    ExtractionState out;

    auto missing = ExtractionStateStore::Load(tmp.Path() + "/none.json", out);
    ASSERT_FALSE(missing.is_ok());
    EXPECT_EQ(missing.code, ErrorCode::NotFound);

    const std::string bad = tmp.Path() + "/bad.json";
    testutil::WriteFile(bad, "{\"zip_path\": 3}");
    auto corrupt = ExtractionStateStore::Load(bad, out);
    ASSERT_FALSE(corrupt.is_ok());
    EXPECT_EQ(corrupt.code, ErrorCode::StateConflict);
}

TEST(ExtractionStateTest, SaveThenLoad) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/" + ExtractionStateStore::kFileName;

    ASSERT_TRUE(ExtractionStateStore::Save(path, SampleState()).is_ok());
    ExtractionState loaded;
    auto res = ExtractionStateStore::Load(path, loaded);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(loaded.order, SampleState().order);
    EXPECT_EQ(loaded.cursor, 1u);
}

TEST(ExtractionStateTest, NormalizeExtensions) {
    EXPECT_TRUE(NormalizeExtensions(std::nullopt).empty());
    EXPECT_TRUE(NormalizeExtensions(std::vector<std::string>{}).empty());
    EXPECT_TRUE(NormalizeExtensions(std::vector<std::string>{"", "  "}).empty());
    EXPECT_EQ(NormalizeExtensions(std::vector<std::string>{"CSV", " .txt", ".csv"}),
              (std::vector<std::string>{".csv", ".txt"}));
}

TEST(ExtractionStateTest, ErrorPolicyNames) {
    ErrorPolicy p{};
    ASSERT_TRUE(ParseErrorPolicy("abort", p).is_ok());
    EXPECT_EQ(p, ErrorPolicy::Abort);
    EXPECT_STREQ(ErrorPolicyName(p), "abort");
    auto bad = ParseErrorPolicy("ignore", p);
    EXPECT_EQ(bad.code, ErrorCode::ValidationError);
}

} // namespace arcnav
