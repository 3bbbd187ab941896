#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#ifdef HAVE_LMDB
#include <lmdb.h>
#endif

namespace lantern {

using json = nlohmann::json;
namespace fs = std::filesystem;

// Backends throw std::runtime_error when the medium fails.
class KeyValueStore {
public:
	virtual ~KeyValueStore() = default;
	virtual std::optional<json> get(const std::string &key) = 0;
	virtual void put(const std::string &key, const json &value) = 0;
	virtual void del(const std::string &key) = 0;
	virtual std::vector<std::pair<std::string, json>> entries(const std::string &prefix) = 0;
	virtual void flush() {}
};

#ifdef HAVE_LMDB
class LmdbStore : public KeyValueStore {
public:
	LmdbStore(const std::string &name, const fs::path &rootDir, std::size_t mapSizeBytes);
	~LmdbStore() override;

	bool ok() const { return ok_; }

	std::optional<json> get(const std::string &key) override;
	void put(const std::string &key, const json &value) override;
	void del(const std::string &key) override;
	std::vector<std::pair<std::string, json>> entries(const std::string &prefix) override;

private:
	std::string name_;
	fs::path rootDir_;
	std::size_t mapSizeBytes_;
	bool ok_{false};
	MDB_env *env_{nullptr};
	MDB_dbi dbi_{0};
};
#endif

// Keeps everything in memory and rewrites <rootDir>/<name>.json when dirty.
class JsonFileStore : public KeyValueStore {
public:
	JsonFileStore(const std::string &name, const fs::path &rootDir, int flushIntervalMs = 10000);
	~JsonFileStore() override;

	std::optional<json> get(const std::string &key) override;
	void put(const std::string &key, const json &value) override;
	void del(const std::string &key) override;
	std::vector<std::pair<std::string, json>> entries(const std::string &prefix) override;
	void flush() override;

	const fs::path &file() const { return file_; }

private:
	void load();
	void startFlushThread();
	void stopFlushThread();

	std::string name_;
	fs::path rootDir_;
	fs::path file_;
	int flushIntervalMs_{10000};
	bool dirty_{false};
	std::unordered_map<std::string, json> data_;
	std::vector<std::string> order_;
	std::mutex mu_;
	std::mutex flushMu_;
	std::condition_variable flushCv_;
	std::atomic<bool> running_{false};
	std::thread flushThread_;
};

} // namespace lantern
