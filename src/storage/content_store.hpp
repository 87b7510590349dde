#pragma once

#include "dcmx/common.hpp"
#include "dcmx/error.hpp"
#include <string>
#include <vector>
#include <filesystem>

namespace dcmx::storage {

/**
 * Content-addressed byte storage on local disk
 *
 * Objects live at <root>/<hash[0:2]>/<hash>, one file per object, named by
 * the full lowercase SHA-256 hex digest of their bytes. Writes go through a
 * temporary file in the shard directory, synced, and renamed into place, so
 * a failed store never leaves a partial object visible.
 */
class ContentStore {
public:
    /**
     * Open (and create if needed) a store rooted at root_dir
     * @throws StorageException if the root directory cannot be created
     */
    explicit ContentStore(const std::filesystem::path& root_dir);
    ~ContentStore();

    // Disable copy, allow move
    ContentStore(const ContentStore&) = delete;
    ContentStore& operator=(const ContentStore&) = delete;
    ContentStore(ContentStore&&) noexcept;
    ContentStore& operator=(ContentStore&&) noexcept;

    /**
     * Hash and persist a payload. Storing bytes that are already present is a
     * successful no-op.
     * @return Content hash of data
     */
    Result<ContentHash> store(const bytes& data);

    /**
     * Persist a payload under a precomputed hash
     * @return ContentHashMismatch if data does not hash to expected
     */
    Result<ContentHash> store(const ContentHash& expected, const bytes& data);

    /**
     * Read back the exact bytes of an object
     * @return StorageNotFound if the hash is unknown, StorageCorrupted if the
     *         file no longer hashes to its name
     */
    Result<bytes> retrieve(const ContentHash& content_hash) const;

    /**
     * Existence check without reading the payload
     */
    bool exists(const ContentHash& content_hash) const;

    /**
     * Delete an object
     * @return StorageNotFound if absent
     */
    Result<void> remove(const ContentHash& content_hash);

    /**
     * List all stored content hashes
     */
    std::vector<ContentHash> list_content() const;

    /**
     * Total size of stored objects in bytes
     */
    uint64_t total_size() const;

    /**
     * Number of stored objects
     */
    size_t item_count() const;

    /**
     * Final path of an object (whether or not it exists)
     */
    std::filesystem::path path_for(const ContentHash& content_hash) const;

    const std::filesystem::path& root() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dcmx::storage
