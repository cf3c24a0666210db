#include <catch2/catch_test_macros.hpp>
#include "tether/artifact_store.hpp"
#include "tether/crypto.hpp"
#include "test_support.hpp"
#include <fstream>

using namespace tether;
using tether::testing::TempDir;
using tether::testing::count_files;

TEST_CASE("Artifacts are written with a metadata bundle", "[artifact]")
{
    TempDir dir;
    FilesystemArtifactStore store(dir / "features");
    auto data = Dataset::create({"age", "ratio"}, {{"30", "0.5"}, {"41", "0.25"}}).value();

    auto stored = store.persist(data, {{"applied", nlohmann::json::array({"ratio"})}}, "features");
    REQUIRE(stored.has_value());
    REQUIRE(std::filesystem::exists(stored->data_path));
    REQUIRE(std::filesystem::exists(stored->metadata_path));
    REQUIRE(stored->data_path.filename().string().starts_with("features_"));
    REQUIRE(stored->data_path.extension() == ".csv");

    auto back = Dataset::read_csv(stored->data_path);
    REQUIRE(back.has_value());
    REQUIRE(*back == data);

    std::ifstream meta_in(stored->metadata_path);
    auto meta = nlohmann::json::parse(meta_in);
    REQUIRE(meta["rows"] == 2);
    REQUIRE(meta["applied"][0] == "ratio");
    REQUIRE(meta["sha256"] == crypto::SHA256::to_hex(crypto::SHA256::hash(std::string_view(data.to_csv()))));
    REQUIRE(meta["data_file"] == stored->data_path.filename().string());

    // no temporaries left behind
    REQUIRE(count_files(dir / "features") == 2);
}

TEST_CASE("Artifact names never collide", "[artifact]")
{
    TempDir dir;
    FilesystemArtifactStore store(dir.path());
    auto data = Dataset::create({"x"}, {{"1"}}).value();

    auto a = store.persist(data, nlohmann::json::object(), "batch");
    auto b = store.persist(data, nlohmann::json::object(), "batch");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->data_path != b->data_path);
    REQUIRE(count_files(dir.path()) == 4);
}

TEST_CASE("Artifact store rejects unsafe input", "[artifact]")
{
    TempDir dir;
    FilesystemArtifactStore store(dir.path());
    auto data = Dataset::create({"x"}, {{"1"}}).value();

    REQUIRE_FALSE(store.persist(data, nlohmann::json::object(), "../escape").has_value());
    REQUIRE_FALSE(store.persist(data, nlohmann::json::object(), "").has_value());
    REQUIRE_FALSE(store.persist(data, nlohmann::json::array(), "ok").has_value());
    REQUIRE(count_files(dir.path()) == 0);
}
