#include "content_store.hpp"
#include "crypto/sha256.hpp"
#include "crypto/random.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <system_error>
#include <cerrno>

#ifndef DCMX_PLATFORM_WINDOWS
#include <fcntl.h>
#include <unistd.h>
#endif

namespace dcmx::storage {

namespace fs = std::filesystem;

namespace {
    std::string short_hash(const std::string& hex) {
        return hex.substr(0, 16);
    }

    std::string temp_name_for(const std::string& hash_str) {
        std::ostringstream oss;
        oss << '.' << hash_str << '.' << std::hex << std::setw(8) << std::setfill('0')
            << crypto::Random::generate_uint32() << ".tmp";
        return oss.str();
    }

    // Flush a file or directory entry to stable storage
    std::error_code sync_path(const fs::path& path) {
#ifdef DCMX_PLATFORM_WINDOWS
        (void)path;
        return {};
#else
        int fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0) {
            return std::error_code(errno, std::generic_category());
        }
        std::error_code ec;
        if (::fsync(fd) != 0) {
            ec = std::error_code(errno, std::generic_category());
        }
        ::close(fd);
        return ec;
#endif
    }
}

class ContentStore::Impl {
public:
    explicit Impl(const fs::path& root_dir)
        : root_(root_dir)
    {
        std::error_code ec;
        fs::create_directories(root_, ec);
        if (ec) {
            throw StorageException(ErrorCode::StorageWriteFailed,
                "cannot create content store at " + root_.string() + ": " + ec.message());
        }

        DCMX_LOG_INFO("Content store initialized at: {}", root_.string());
    }

    fs::path path_for(const ContentHash& hash) const {
        std::string hash_str = hash.to_string();
        // First two hex chars select the shard directory
        std::string shard = hash_str.substr(0, constants::SHARD_PREFIX_LENGTH);
        return root_ / shard / hash_str;
    }

    bool exists(const ContentHash& hash) const {
        std::error_code ec;
        return fs::is_regular_file(path_for(hash), ec);
    }

    Result<ContentHash> write(const ContentHash& hash, const bytes& data) {
        if (data.size() > constants::MAX_CONTENT_SIZE) {
            return Result<ContentHash>::Err(ErrorCode::ContentTooLarge,
                "payload exceeds maximum content size",
                std::to_string(data.size()) + " bytes");
        }

        const std::string hash_str = hash.to_string();
        const fs::path final_path = path_for(hash);

        if (exists(hash)) {
            DCMX_LOG_DEBUG("Content {}... already exists", short_hash(hash_str));
            return Result<ContentHash>::Ok(hash);
        }

        std::error_code ec;
        fs::create_directories(final_path.parent_path(), ec);
        if (ec) {
            DCMX_LOG_ERROR("Failed to create shard directory {}: {}",
                           final_path.parent_path().string(), ec.message());
            return Result<ContentHash>::Err(ErrorCode::StorageWriteFailed,
                "cannot create shard directory", ec.message());
        }

        const fs::path temp_path = final_path.parent_path() / temp_name_for(hash_str);

        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                DCMX_LOG_ERROR("Failed to create content file: {}", temp_path.string());
                return Result<ContentHash>::Err(ErrorCode::StorageWriteFailed,
                    "cannot create temporary file", temp_path.string());
            }

            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            file.flush();
            if (!file) {
                file.close();
                discard(temp_path);
                DCMX_LOG_ERROR("Failed to write content file: {}", temp_path.string());
                return Result<ContentHash>::Err(ErrorCode::StorageWriteFailed,
                    "short write", temp_path.string());
            }
        }

        // Payload must be durable before its name becomes visible
        ec = sync_path(temp_path);
        if (ec) {
            discard(temp_path);
            DCMX_LOG_ERROR("Failed to sync content file {}: {}", temp_path.string(), ec.message());
            return Result<ContentHash>::Err(ErrorCode::StorageWriteFailed,
                "cannot sync temporary file", ec.message());
        }

        fs::rename(temp_path, final_path, ec);
        if (ec) {
            discard(temp_path);
            DCMX_LOG_ERROR("Failed to publish content {}: {}", final_path.string(), ec.message());
            return Result<ContentHash>::Err(ErrorCode::StorageWriteFailed,
                "cannot move object into place", ec.message());
        }

        ec = sync_path(final_path.parent_path());
        if (ec) {
            DCMX_LOG_WARN("Failed to sync shard directory {}: {}",
                          final_path.parent_path().string(), ec.message());
        }

        DCMX_LOG_INFO("Stored content {}... ({} bytes)", short_hash(hash_str), data.size());
        return Result<ContentHash>::Ok(hash);
    }

    Result<bytes> read(const ContentHash& hash) const {
        const fs::path path = path_for(hash);

        if (!exists(hash)) {
            DCMX_LOG_DEBUG("Content {}... not found", short_hash(hash.to_string()));
            return Result<bytes>::Err(ErrorCode::StorageNotFound,
                "content not found", hash.to_string());
        }

        std::error_code ec;
        auto size = fs::file_size(path, ec);
        if (ec) {
            return Result<bytes>::Err(ErrorCode::StorageReadFailed,
                "cannot stat content file", ec.message());
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            DCMX_LOG_ERROR("Failed to open content file: {}", path.string());
            return Result<bytes>::Err(ErrorCode::StorageReadFailed,
                "cannot open content file", path.string());
        }

        bytes data(static_cast<size_t>(size));
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
        if (!file || static_cast<uint64_t>(file.gcount()) != size) {
            DCMX_LOG_ERROR("Failed to read content file: {}", path.string());
            return Result<bytes>::Err(ErrorCode::StorageReadFailed,
                "short read", path.string());
        }

        if (ContentHash(crypto::Sha256::hash(data)) != hash) {
            DCMX_LOG_ERROR("Content file {} does not match its hash", path.string());
            return Result<bytes>::Err(ErrorCode::StorageCorrupted,
                "stored bytes do not match content hash", path.string());
        }

        DCMX_LOG_DEBUG("Retrieved content {}... ({} bytes)",
                       short_hash(hash.to_string()), data.size());
        return Result<bytes>::Ok(std::move(data));
    }

    Result<void> remove(const ContentHash& hash) {
        const fs::path path = path_for(hash);
        std::error_code ec;
        bool removed = fs::remove(path, ec);

        if (ec) {
            DCMX_LOG_ERROR("Failed to delete content: {} ({})", path.string(), ec.message());
            return Result<void>::Err(ErrorCode::StorageWriteFailed,
                "cannot delete content", ec.message());
        }
        if (!removed) {
            return Result<void>::Err(ErrorCode::StorageNotFound,
                "content not found", hash.to_string());
        }

        DCMX_LOG_INFO("Deleted content {}...", short_hash(hash.to_string()));
        return Result<void>::Ok();
    }

    template<typename Visitor>
    void for_each_object(Visitor&& visit) const {
        std::error_code ec;
        for (fs::directory_iterator shard(root_, ec), end; !ec && shard != end; shard.increment(ec)) {
            std::error_code dir_ec;
            if (!shard->is_directory(dir_ec)) continue;

            const std::string shard_name = shard->path().filename().string();
            std::error_code inner_ec;
            for (fs::directory_iterator entry(shard->path(), inner_ec);
                 !inner_ec && entry != end; entry.increment(inner_ec)) {
                const std::string name = entry->path().filename().string();
                // Skips in-flight temporaries and foreign files
                if (!is_hex_hash(name) ||
                    name.compare(0, constants::SHARD_PREFIX_LENGTH, shard_name) != 0) {
                    continue;
                }
                std::error_code file_ec;
                if (entry->is_regular_file(file_ec)) {
                    visit(ContentHash::from_string(name), *entry);
                }
            }
            if (inner_ec) {
                DCMX_LOG_WARN("Failed to scan shard {}: {}", shard->path().string(), inner_ec.message());
            }
        }
        if (ec) {
            DCMX_LOG_WARN("Failed to scan content store {}: {}", root_.string(), ec.message());
        }
    }

    const fs::path& root() const { return root_; }

private:
    static void discard(const fs::path& temp_path) {
        std::error_code ec;
        fs::remove(temp_path, ec);
        if (ec) {
            DCMX_LOG_WARN("Failed to remove temporary file {}: {}", temp_path.string(), ec.message());
        }
    }

    fs::path root_;
};

// ContentStore implementation
ContentStore::ContentStore(const fs::path& root_dir)
    : impl_(std::make_unique<Impl>(root_dir))
{}

ContentStore::~ContentStore() = default;
ContentStore::ContentStore(ContentStore&&) noexcept = default;
ContentStore& ContentStore::operator=(ContentStore&&) noexcept = default;

Result<ContentHash> ContentStore::store(const bytes& data) {
    return impl_->write(ContentHash(crypto::Sha256::hash(data)), data);
}

Result<ContentHash> ContentStore::store(const ContentHash& expected, const bytes& data) {
    ContentHash actual(crypto::Sha256::hash(data));
    if (actual != expected) {
        DCMX_LOG_WARN("Refusing to store content: expected {}, got {}",
                      expected.to_string(), actual.to_string());
        return Result<ContentHash>::Err(ErrorCode::ContentHashMismatch,
            "payload does not match content hash", expected.to_string());
    }
    return impl_->write(actual, data);
}

Result<bytes> ContentStore::retrieve(const ContentHash& content_hash) const {
    return impl_->read(content_hash);
}

bool ContentStore::exists(const ContentHash& content_hash) const {
    return impl_->exists(content_hash);
}

Result<void> ContentStore::remove(const ContentHash& content_hash) {
    return impl_->remove(content_hash);
}

std::vector<ContentHash> ContentStore::list_content() const {
    std::vector<ContentHash> hashes;
    impl_->for_each_object([&hashes](const ContentHash& hash, const fs::directory_entry&) {
        hashes.push_back(hash);
    });
    return hashes;
}

uint64_t ContentStore::total_size() const {
    uint64_t total = 0;
    impl_->for_each_object([&total](const ContentHash&, const fs::directory_entry& entry) {
        std::error_code ec;
        auto size = entry.file_size(ec);
        if (!ec) {
            total += size;
        }
    });
    return total;
}

size_t ContentStore::item_count() const {
    return list_content().size();
}

fs::path ContentStore::path_for(const ContentHash& content_hash) const {
    return impl_->path_for(content_hash);
}

const fs::path& ContentStore::root() const {
    return impl_->root();
}

} // namespace dcmx::storage
