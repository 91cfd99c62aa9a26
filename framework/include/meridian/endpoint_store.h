#ifndef MERIDIAN_ENDPOINT_STORE_H
#define MERIDIAN_ENDPOINT_STORE_H

#include <meridian/endpoint.h>
#include <filesystem>
#include <functional>
#include <optional>

namespace meridian {

/**
 * @brief Durable endpoint list shared between processes through one JSON file.
 *
 * Locking goes through a sibling `<path>.lock` file: readers hold a shared
 * flock on it while reading, writers an exclusive one for the whole
 * read-modify-write. New content is written to `<path>.tmp`, synced and
 * renamed over the data file, so a reader sees either the old or the new
 * array and a failed write leaves the old one in place.
 */
class EndpointStore {
public:
    /**
     * @brief Rewrites a freshly read snapshot; std::nullopt means "nothing to write".
     */
    using Transform = std::function<std::optional<EndpointSnapshot>(const EndpointSnapshot&)>;

    explicit EndpointStore(std::filesystem::path path);

    /**
     * @brief Reads and parses the file.
     * @throws ConfigLoadFailed on I/O, lock or parse failure.
     */
    EndpointSnapshot load() const;

    /**
     * @brief Replaces the file content with @p records under an exclusive lock.
     * @return false for an empty payload or any I/O failure; the file is then left untouched.
     */
    bool persist(const EndpointSnapshot& records) const;

    /**
     * @brief Read-modify-write under a single exclusive lock.
     * @param fallback Used as the current state when the file is missing or malformed.
     */
    bool update(const Transform& transform, const EndpointSnapshot& fallback = {}) const;

    const std::filesystem::path& path() const { return path_; }
    const std::filesystem::path& lock_path() const { return lock_path_; }

private:
    std::filesystem::path path_;
    std::filesystem::path lock_path_;
};

} // namespace meridian

#endif // MERIDIAN_ENDPOINT_STORE_H
