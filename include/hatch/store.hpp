#pragma once

/**
 * @file store.hpp
 * @brief Hierarchical key/value system store
 *
 * The OS-integration database is modelled as a tree of keys. Each key holds
 * named string values; the value with the empty name is the key's default
 * value. Key paths use '\' as the separator. Key segments and value names
 * compare case-insensitively while their original spelling is preserved.
 *
 * The integration engine only talks to the SystemStore interface, so it can
 * be exercised against MemoryStore in tests.
 */

#include "hatch/result.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hatch {

// ============================================================================
// Key Path Helpers
// ============================================================================

// Split "A\B\C" into segments. Leading/trailing separators are ignored.
// Returns nullopt when the path is empty or has an empty segment ("A\\B").
std::optional<std::vector<std::string>> split_key_path(const std::string& path);

std::string join_key_path(const std::vector<std::string>& segments);

// Canonical spelling of a valid path (single separators, no edge separators)
std::optional<std::string> normalize_key_path(const std::string& path);

// Case-insensitive comparison of two key paths after normalization
bool key_path_equal(const std::string& a, const std::string& b);

// Case-insensitive comparison of two value names
bool name_equal(const std::string& a, const std::string& b);

// True if descendant is key or lies beneath it
bool key_path_within(const std::string& descendant, const std::string& key);

// ============================================================================
// SystemStore Interface
// ============================================================================

struct StoreValue {
    std::string name;   // empty = default value
    std::string data;
};

class SystemStore {
public:
    virtual ~SystemStore() = default;

    // Value at (path, value_name), nullopt if the key or the value is absent
    virtual Result<std::optional<std::string>> get(const std::string& path,
                                                   const std::string& value_name) const = 0;

    virtual Result<bool> keyExists(const std::string& path) const = 0;

    // Set a value, creating the key and any missing ancestors
    virtual Result<void> setValue(const std::string& path,
                                  const std::string& value_name,
                                  const std::string& data) = 0;

    // Delete one value. A missing key or value is not an error.
    virtual Result<void> deleteValue(const std::string& path,
                                     const std::string& value_name) = 0;

    // Delete a key and everything beneath it. A missing key is not an error.
    virtual Result<void> deleteKeyTree(const std::string& path) = 0;

    // Values directly on the key, sorted by name
    virtual Result<std::vector<StoreValue>> listValues(const std::string& path) const = 0;

    // Names of immediate subkeys, sorted
    virtual Result<std::vector<std::string>> listSubkeys(const std::string& path) const = 0;
};

// ============================================================================
// MemoryStore
// ============================================================================

class MemoryStore : public SystemStore {
public:
    MemoryStore() = default;

    Result<std::optional<std::string>> get(const std::string& path,
                                           const std::string& value_name) const override;
    Result<bool> keyExists(const std::string& path) const override;
    Result<void> setValue(const std::string& path,
                          const std::string& value_name,
                          const std::string& data) override;
    Result<void> deleteValue(const std::string& path,
                             const std::string& value_name) override;
    Result<void> deleteKeyTree(const std::string& path) override;
    Result<std::vector<StoreValue>> listValues(const std::string& path) const override;
    Result<std::vector<std::string>> listSubkeys(const std::string& path) const override;

    size_t keyCount() const { return keys_.size(); }

protected:
    struct KeyRecord {
        std::string path;                          // as first written
        std::map<std::string, StoreValue> values;  // lowered name -> value
    };

    // lowered full path -> key
    using KeyMap = std::map<std::string, KeyRecord>;

    KeyMap keys_;

    // Called after every successful mutation. FileStore persists here; a
    // failure reverts keys_ to the snapshot taken before the mutation.
    virtual Result<void> commit() { return Result<void>::ok(); }

private:
    Result<void> finish(KeyMap snapshot);
};

// ============================================================================
// FileStore
// ============================================================================
//
// MemoryStore persisted as a JSON document ("hatch.store.v1"), rewritten
// atomically after every mutation.

constexpr const char* STORE_SCHEMA = "hatch.store.v1";

class FileStore : public MemoryStore {
public:
    // Load the store at path. A missing file yields an empty store; a
    // malformed one is an IO_ERROR.
    static Result<FileStore> open(const std::string& path);

    const std::string& path() const { return path_; }

    std::string serialize() const;

protected:
    Result<void> commit() override;

private:
    explicit FileStore(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

} // namespace hatch
