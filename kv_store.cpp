#include "kv_store.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace lantern {

namespace {

static void ensureDir(const fs::path &dir) {
	if (!fs::exists(dir)) fs::create_directories(dir);
}

} // namespace

// ------------------ LMDB ------------------

#ifdef HAVE_LMDB
static std::runtime_error lmdbError(const std::string &what, int rc) {
	return std::runtime_error("lmdb " + what + ": " + mdb_strerror(rc));
}

LmdbStore::LmdbStore(const std::string &name, const fs::path &rootDir, std::size_t mapSizeBytes)
	: name_(name), rootDir_(rootDir), mapSizeBytes_(mapSizeBytes) {
	ensureDir(rootDir_ / name_);
	fs::path envPath = rootDir_ / name_;
	int rc = mdb_env_create(&env_);
	if (rc != 0) {
		std::cerr << "[Store] lmdb env_create failed: " << mdb_strerror(rc) << std::endl;
		env_ = nullptr;
		return;
	}
	auto fail = [this](const char *what, int code) {
		std::cerr << "[Store] lmdb " << what << " failed for " << name_ << ": " << mdb_strerror(code) << std::endl;
		mdb_env_close(env_);
		env_ = nullptr;
	};
	if ((rc = mdb_env_set_maxreaders(env_, 64)) != 0) {
		fail("set_maxreaders", rc);
		return;
	}
	if ((rc = mdb_env_set_mapsize(env_, mapSizeBytes_)) != 0) {
		fail("set_mapsize", rc);
		return;
	}
	if ((rc = mdb_env_open(env_, envPath.string().c_str(), 0, 0664)) != 0) {
		fail("env_open", rc);
		return;
	}
	MDB_txn *txn = nullptr;
	if ((rc = mdb_txn_begin(env_, nullptr, 0, &txn)) != 0) {
		fail("txn_begin", rc);
		return;
	}
	if ((rc = mdb_dbi_open(txn, "default", MDB_CREATE, &dbi_)) != 0) {
		mdb_txn_abort(txn);
		fail("dbi_open", rc);
		return;
	}
	if ((rc = mdb_txn_commit(txn)) != 0) {
		fail("txn_commit", rc);
		return;
	}
	ok_ = true;
}

LmdbStore::~LmdbStore() {
	if (env_) {
		mdb_dbi_close(env_, dbi_);
		mdb_env_close(env_);
	}
}

std::optional<json> LmdbStore::get(const std::string &key) {
	if (!ok_) throw std::runtime_error("lmdb store " + name_ + " is not open");
	MDB_txn *txn = nullptr;
	MDB_val k{key.size(), (void *)key.data()};
	MDB_val v;
	int rc = mdb_txn_begin(env_, nullptr, MDB_RDONLY, &txn);
	if (rc != 0) throw lmdbError("txn_begin", rc);
	rc = mdb_get(txn, dbi_, &k, &v);
	if (rc == MDB_NOTFOUND) {
		mdb_txn_abort(txn);
		return std::nullopt;
	}
	if (rc != 0) {
		mdb_txn_abort(txn);
		throw lmdbError("get", rc);
	}
	std::string raw((char *)v.mv_data, v.mv_size);
	mdb_txn_abort(txn);
	return json::parse(raw);
}

void LmdbStore::put(const std::string &key, const json &value) {
	if (!ok_) throw std::runtime_error("lmdb store " + name_ + " is not open");
	MDB_txn *txn = nullptr;
	int rc = mdb_txn_begin(env_, nullptr, 0, &txn);
	if (rc != 0) throw lmdbError("txn_begin", rc);
	std::string encoded = value.dump();
	MDB_val k{key.size(), (void *)key.data()};
	MDB_val v{encoded.size(), (void *)encoded.data()};
	rc = mdb_put(txn, dbi_, &k, &v, 0);
	if (rc != 0) {
		mdb_txn_abort(txn);
		throw lmdbError("put", rc);
	}
	rc = mdb_txn_commit(txn);
	if (rc != 0) throw lmdbError("commit", rc);
}

void LmdbStore::del(const std::string &key) {
	if (!ok_) throw std::runtime_error("lmdb store " + name_ + " is not open");
	MDB_txn *txn = nullptr;
	int rc = mdb_txn_begin(env_, nullptr, 0, &txn);
	if (rc != 0) throw lmdbError("txn_begin", rc);
	MDB_val k{key.size(), (void *)key.data()};
	rc = mdb_del(txn, dbi_, &k, nullptr);
	if (rc != 0 && rc != MDB_NOTFOUND) {
		mdb_txn_abort(txn);
		throw lmdbError("del", rc);
	}
	rc = mdb_txn_commit(txn);
	if (rc != 0) throw lmdbError("commit", rc);
}

std::vector<std::pair<std::string, json>> LmdbStore::entries(const std::string &prefix) {
	std::vector<std::pair<std::string, json>> out;
	if (!ok_) throw std::runtime_error("lmdb store " + name_ + " is not open");
	MDB_txn *txn = nullptr;
	MDB_cursor *cursor = nullptr;
	int rc = mdb_txn_begin(env_, nullptr, MDB_RDONLY, &txn);
	if (rc != 0) throw lmdbError("txn_begin", rc);
	rc = mdb_cursor_open(txn, dbi_, &cursor);
	if (rc != 0) {
		mdb_txn_abort(txn);
		throw lmdbError("cursor_open", rc);
	}
	MDB_val k, v;
	std::string start = prefix;
	k.mv_size = start.size();
	k.mv_data = (void *)start.data();
	rc = mdb_cursor_get(cursor, &k, &v, prefix.empty() ? MDB_FIRST : MDB_SET_RANGE);
	while (rc == 0) {
		std::string key((char *)k.mv_data, k.mv_size);
		if (!prefix.empty() && key.rfind(prefix, 0) != 0) break;
		std::string raw((char *)v.mv_data, v.mv_size);
		out.push_back({key, json::parse(raw)});
		rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
	}
	mdb_cursor_close(cursor);
	mdb_txn_abort(txn);
	if (rc != 0 && rc != MDB_NOTFOUND) throw lmdbError("cursor_get", rc);
	return out;
}
#endif

// ------------------ JSON file ------------------

JsonFileStore::JsonFileStore(const std::string &name, const fs::path &rootDir, int flushIntervalMs)
	: name_(name), rootDir_(rootDir), flushIntervalMs_(flushIntervalMs) {
	ensureDir(rootDir_);
	file_ = rootDir_ / (name_ + ".json");
	load();
	if (flushIntervalMs_ > 0) startFlushThread();
}

JsonFileStore::~JsonFileStore() {
	stopFlushThread();
	try {
		flush();
	} catch (const std::exception &e) {
		std::cerr << "[Store] Final flush of " << file_.string() << " failed: " << e.what() << std::endl;
	}
}

void JsonFileStore::load() {
	if (!fs::exists(file_)) return;
	std::ifstream in(file_);
	if (!in) throw std::runtime_error("cannot open " + file_.string());
	nlohmann::ordered_json j;
	try {
		in >> j;
	} catch (const json::parse_error &e) {
		throw std::runtime_error("corrupt store file " + file_.string() + ": " + e.what());
	}
	if (!j.is_object()) return;
	for (auto it = j.begin(); it != j.end(); ++it) {
		json value = it.value();
		if (value.is_string()) {
			const auto raw = value.get<std::string>();
			json parsed = json::parse(raw, nullptr, false);
			data_[it.key()] = parsed.is_discarded() ? value : parsed;
		} else {
			data_[it.key()] = value;
		}
		order_.push_back(it.key());
	}
}

std::optional<json> JsonFileStore::get(const std::string &key) {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = data_.find(key);
	if (it == data_.end()) return std::nullopt;
	return it->second;
}

void JsonFileStore::put(const std::string &key, const json &value) {
	std::lock_guard<std::mutex> lock(mu_);
	if (!data_.count(key)) order_.push_back(key);
	data_[key] = value;
	dirty_ = true;
}

void JsonFileStore::del(const std::string &key) {
	std::lock_guard<std::mutex> lock(mu_);
	if (data_.erase(key) > 0) {
		order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
		dirty_ = true;
	}
}

std::vector<std::pair<std::string, json>> JsonFileStore::entries(const std::string &prefix) {
	std::vector<std::pair<std::string, json>> out;
	std::lock_guard<std::mutex> lock(mu_);
	for (auto &key : order_) {
		auto it = data_.find(key);
		if (it == data_.end()) continue;
		if (prefix.empty() || key.rfind(prefix, 0) == 0) out.push_back(*it);
	}
	return out;
}

void JsonFileStore::flush() {
	std::lock_guard<std::mutex> lock(mu_);
	if (!dirty_) return;
	nlohmann::ordered_json j = nlohmann::ordered_json::object();
	for (auto &key : order_) {
		auto it = data_.find(key);
		if (it != data_.end()) j[key] = it->second.dump();
	}
	fs::path tmp = file_;
	tmp += ".tmp";
	{
		std::ofstream out(tmp, std::ios::trunc);
		if (!out) throw std::runtime_error("cannot write " + tmp.string());
		out << j.dump(2);
		if (!out) throw std::runtime_error("short write to " + tmp.string());
	}
	fs::rename(tmp, file_);
	dirty_ = false;
}

void JsonFileStore::startFlushThread() {
	running_.store(true);
	flushThread_ = std::thread([this]() {
		while (running_.load()) {
			{
				std::unique_lock<std::mutex> lock(flushMu_);
				flushCv_.wait_for(lock, std::chrono::milliseconds(flushIntervalMs_), [this]() { return !running_.load(); });
			}
			if (!running_.load()) break;
			try {
				flush();
			} catch (const std::exception &e) {
				std::cerr << "[Store] Flush of " << file_.string() << " failed: " << e.what() << std::endl;
			}
		}
	});
}

void JsonFileStore::stopFlushThread() {
	{
		std::lock_guard<std::mutex> lock(flushMu_);
		running_.store(false);
	}
	flushCv_.notify_all();
	if (flushThread_.joinable()) flushThread_.join();
}

} // namespace lantern
