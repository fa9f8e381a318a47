#ifndef CACHE_STORE_HPP
#define CACHE_STORE_HPP

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief Durable string key/value store.
 *
 * Mutating calls are write-through: they return only after the full key set
 * has been persisted, or throw if persisting failed.
 */
class CacheStore {
  public:
    virtual ~CacheStore() = default;
    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    /// Removing a missing key is not an error.
    virtual void remove(const std::string& key) = 0;
    virtual void clear() = 0;
};

/** Replace `%` and every character of @p reserved with `%XX` (upper-case hex). */
std::string percent_encode(const std::string& text, const std::string& reserved);

/** Reverse of percent_encode. A `%` not followed by two hex digits is kept as is. */
std::string percent_decode(const std::string& text);

/**
 * @brief CacheStore backed by a `key=value` text file.
 *
 * The file is read once on construction; a missing file is an empty store.
 * Each mutation rewrites the whole file through a sibling temporary file that
 * is renamed over the target. Lines without `=` are ignored on load; the first
 * `=` separates key from value, so values may contain `=`. Line breaks and
 * `%` are percent-encoded on disk, as is `=` inside keys, so any string
 * reloads unchanged.
 *
 * One process per cache file. No cross-process locking is attempted.
 */
class FileCacheStore : public CacheStore {
  public:
    /**
     * @throws std::runtime_error if @p path exists but cannot be read.
     */
    explicit FileCacheStore(std::filesystem::path path);

    std::optional<std::string> get(const std::string& key) const override;

    /**
     * @throws std::runtime_error if the file cannot be written. The in-memory
     *         value is updated regardless.
     */
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;
    void clear() override;

    const std::filesystem::path& path() const { return path_; }

  private:
    void load();
    void save() const;

    std::filesystem::path path_;
    std::map<std::string, std::string> values_;
    mutable std::mutex mtx_;
};

#endif // CACHE_STORE_HPP
