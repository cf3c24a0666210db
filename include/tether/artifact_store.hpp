#pragma once

#include "dataset.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace tether
{

    struct PersistedArtifact
    {
        std::filesystem::path data_path;
        std::filesystem::path metadata_path;
        std::string sha256; // hex digest of the written CSV
    };

    /**
     * Durable storage for transformed datasets. Only the gated apply path
     * writes here; everything else in the system is scratch space.
     */
    class ArtifactStore
    {
    public:
        virtual ~ArtifactStore() = default;

        /**
         * Persist a dataset together with its metadata bundle.
         * @param data Dataset to write
         * @param metadata JSON object stored beside the data
         * @param name Base name; a UTC timestamp is appended
         */
        virtual Result<PersistedArtifact> persist(const Dataset &data,
                                                  const nlohmann::json &metadata,
                                                  const std::string &name) = 0;
    };

    /**
     * Writes <output_dir>/<name>_<timestamp>.csv and .meta.json. Each file is
     * written to a temporary sibling and renamed into place, so readers never
     * observe a partial artifact.
     */
    class FilesystemArtifactStore : public ArtifactStore
    {
    public:
        explicit FilesystemArtifactStore(std::filesystem::path output_dir);

        Result<PersistedArtifact> persist(const Dataset &data,
                                          const nlohmann::json &metadata,
                                          const std::string &name) override;

        const std::filesystem::path &output_dir() const { return output_dir_; }

    private:
        std::filesystem::path output_dir_;
    };

} // namespace tether
