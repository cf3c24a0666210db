#include "tether/artifact_store.hpp"
#include "tether/clock.hpp"
#include "tether/crypto.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace tether
{
    namespace
    {
        Result<void> write_atomically(const std::filesystem::path &target, const std::string &content)
        {
            auto tmp = target;
            tmp += ".tmp";
            {
                std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
                if (!out.is_open())
                    return std::unexpected(TetherError::storage("Unable to open " + tmp.string()));
                out << content;
                out.flush();
                if (!out)
                {
                    std::error_code ignored;
                    std::filesystem::remove(tmp, ignored);
                    return std::unexpected(TetherError::storage("Write failed for " + tmp.string()));
                }
            }

            std::error_code ec;
            std::filesystem::rename(tmp, target, ec);
            if (ec)
            {
                std::error_code ignored;
                std::filesystem::remove(tmp, ignored);
                return std::unexpected(TetherError::storage(std::format(
                    "Unable to move {} into place: {}", target.string(), ec.message())));
            }
            return {};
        }
    } // namespace

    FilesystemArtifactStore::FilesystemArtifactStore(std::filesystem::path output_dir)
        : output_dir_(std::move(output_dir)) {}

    Result<PersistedArtifact> FilesystemArtifactStore::persist(const Dataset &data,
                                                               const nlohmann::json &metadata,
                                                               const std::string &name)
    {
        if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..")
            return std::unexpected(TetherError::invalid_input("artifact name must be a plain file name: '" + name + "'"));
        if (!metadata.is_object())
            return std::unexpected(TetherError::invalid_input("artifact metadata must be a JSON object"));

        std::error_code ec;
        std::filesystem::create_directories(output_dir_, ec);
        if (ec)
            return std::unexpected(TetherError::storage(std::format(
                "Unable to create {}: {}", output_dir_.string(), ec.message())));

        const std::string base = name + "_" + compact_utc_timestamp();
        PersistedArtifact artifact;
        for (int attempt = 0;; ++attempt)
        {
            std::string stem = attempt == 0 ? base : std::format("{}-{}", base, attempt);
            artifact.data_path = output_dir_ / (stem + ".csv");
            artifact.metadata_path = output_dir_ / (stem + ".meta.json");
            if (!std::filesystem::exists(artifact.data_path, ec) && !std::filesystem::exists(artifact.metadata_path, ec))
                break;
        }

        const std::string csv = data.to_csv();
        artifact.sha256 = crypto::SHA256::to_hex(crypto::SHA256::hash(std::string_view(csv)));

        nlohmann::json meta = metadata;
        meta["data_file"] = artifact.data_path.filename().string();
        meta["sha256"] = artifact.sha256;
        meta["rows"] = data.row_count();
        meta["columns"] = data.columns();
        meta["written_at"] = utc_timestamp();

        // data first: a metadata file always describes a complete CSV
        if (auto r = write_atomically(artifact.data_path, csv); !r)
            return std::unexpected(r.error());
        if (auto r = write_atomically(artifact.metadata_path, meta.dump(2) + "\n"); !r)
            return std::unexpected(r.error());

        spdlog::info("persisted {} ({} rows)", artifact.data_path.string(), data.row_count());
        return artifact;
    }

} // namespace tether
