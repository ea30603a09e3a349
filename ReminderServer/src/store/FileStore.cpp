#include "FileStore.h"
#include "../observability/Logging.h"
#include "../net/MiniJson.h"

#include <boost/filesystem.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <sys/file.h>
#include <unistd.h>

namespace fs = boost::filesystem;

namespace store {

namespace {

const char* kRecordExt = ".rec";

std::string sha256_hex(const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr) != 1) {
        throw StoreError("sha256 failed");
    }
    std::ostringstream ss;
    for (unsigned int i = 0; i < md_len; ++i) ss << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
    return ss.str();
}

std::string errno_text(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

void fsync_dir(const std::string& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) throw StoreError(errno_text("open dir", dir));
    int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) throw StoreError(errno_text("fsync dir", dir));
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// "<digits>.rec" -> id
std::optional<uint64_t> id_from_filename(const std::string& name) {
    const std::string ext(kRecordExt);
    if (name.size() <= ext.size() || name.compare(name.size() - ext.size(), ext.size(), ext) != 0) return std::nullopt;
    auto v = parse_int64_strict_sv(std::string_view(name).substr(0, name.size() - ext.size()));
    if (!v.has_value() || *v <= 0) return std::nullopt;
    return uint64_t(*v);
}

}

FileStore::FileStore(std::string dir, int lock_fd)
    : dir_(std::move(dir)), events_dir_(dir_ + "/events"), staging_dir_(dir_ + "/staging"), lock_fd_(lock_fd) {}

FileStore::~FileStore() {
    if (lock_fd_ >= 0) {
        ::flock(lock_fd_, LOCK_UN);
        ::close(lock_fd_);
        observability::log_info("store.lock_released", {{"dir", dir_}});
    }
}

std::unique_ptr<FileStore> FileStore::open(const std::string& dir) {
    boost::system::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw StoreUnavailable("create " + dir + ": " + ec.message());

    const std::string lock_path = dir + "/LOCK";
    int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) throw StoreUnavailable(errno_text("open", lock_path));
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) throw AlreadyRunning(lock_path);
        errno = err;
        throw StoreUnavailable(errno_text("flock", lock_path));
    }

    std::unique_ptr<FileStore> st(new FileStore(dir, fd));
    fs::create_directories(st->events_dir_, ec);
    if (ec) throw StoreUnavailable("create " + st->events_dir_ + ": " + ec.message());
    fs::create_directories(st->staging_dir_, ec);
    if (ec) throw StoreUnavailable("create " + st->staging_dir_ + ": " + ec.message());

    // leftovers of writes interrupted by a crash; the target files were never replaced
    int removed = 0;
    for (fs::directory_iterator it(st->staging_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        boost::system::error_code rm_ec;
        if (fs::remove(it->path(), rm_ec)) ++removed;
    }
    if (ec) throw StoreUnavailable("list " + st->staging_dir_ + ": " + ec.message());
    if (removed > 0) observability::log_warn("store.staging_cleaned", {{"files", int64_t(removed)}});

    st->load_counter();
    observability::log_info("store.opened", {{"backend", std::string("file")}, {"dir", dir}, {"next_id", int64_t(st->next_id_)}});
    return st;
}

std::string FileStore::record_path(uint64_t id) const {
    return events_dir_ + "/" + std::to_string(id) + kRecordExt;
}

std::string FileStore::encode_record(const model::EventRecord& record) {
    std::string body = model::to_json(record);
    return body + "\n" + sha256_hex(body) + "\n";
}

model::EventRecord FileStore::decode_record(uint64_t id, const std::string& contents) {
    size_t nl = contents.find('\n');
    if (nl == std::string::npos) throw CorruptRecord(id, "missing checksum line");
    std::string body = contents.substr(0, nl);
    std::string sum = contents.substr(nl + 1);
    while (!sum.empty() && (sum.back() == '\n' || sum.back() == '\r')) sum.pop_back();
    std::string expect = sha256_hex(body);
    if (sum.size() != expect.size() || CRYPTO_memcmp(sum.data(), expect.data(), expect.size()) != 0) {
        throw CorruptRecord(id, "checksum mismatch");
    }
    auto rec = model::from_json(body);
    if (!rec) throw CorruptRecord(id, "unparseable body");
    if (rec->id != id) throw CorruptRecord(id, "id mismatch");
    return *rec;
}

std::optional<model::EventRecord> FileStore::read_unlocked(uint64_t id) const {
    auto contents = read_file(record_path(id));
    if (!contents) return std::nullopt;
    return decode_record(id, *contents);
}

void FileStore::write_atomic(const std::string& target, const std::string& contents) {
    const std::string tmp = staging_dir_ + "/" + fs::path(target).filename().string() + "." + std::to_string(++staging_seq_) + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) throw StoreError(errno_text("open", tmp));
    size_t off = 0;
    while (off < contents.size()) {
        ssize_t n = ::write(fd, contents.data() + off, contents.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string msg = errno_text("write", tmp);
            ::close(fd);
            ::unlink(tmp.c_str());
            throw StoreError(msg);
        }
        off += size_t(n);
    }
    if (::fsync(fd) != 0) {
        std::string msg = errno_text("fsync", tmp);
        ::close(fd);
        ::unlink(tmp.c_str());
        throw StoreError(msg);
    }
    ::close(fd);
    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        std::string msg = errno_text("rename", tmp);
        ::unlink(tmp.c_str());
        throw StoreError(msg);
    }
    fsync_dir(fs::path(target).parent_path().string());
}

void FileStore::load_counter() {
    uint64_t max_id = 0;
    boost::system::error_code ec;
    for (fs::directory_iterator it(events_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        auto id = id_from_filename(it->path().filename().string());
        if (id && *id > max_id) max_id = *id;
    }
    if (ec) throw StoreUnavailable("list " + events_dir_ + ": " + ec.message());

    uint64_t stored = 0;
    if (auto contents = read_file(dir_ + "/NEXT_ID")) {
        std::string s = *contents;
        while (!s.empty() && (s.back() == '\n' || s.back() == ' ')) s.pop_back();
        auto v = parse_int64_strict_sv(s);
        if (v.has_value() && *v > 0) stored = uint64_t(*v);
        else observability::log_warn("store.counter_unreadable", {{"dir", dir_}});
    }
    next_id_ = std::max<uint64_t>({stored, max_id + 1, 1});
}

uint64_t FileStore::next_id() {
    std::lock_guard<std::mutex> lk(counter_mu_);
    uint64_t id = next_id_;
    write_atomic(dir_ + "/NEXT_ID", std::to_string(id + 1) + "\n");
    next_id_ = id + 1;
    return id;
}

PutResult FileStore::put(uint64_t id, const model::EventRecord& record, uint64_t expected_version) {
    std::lock_guard<std::mutex> lk(stripe(id));
    std::optional<model::EventRecord> current;
    try {
        current = read_unlocked(id);
    } catch (const CorruptRecord& e) {
        if (expected_version != 0) throw;
        // a corrupt file still occupies the id
        observability::log_warn("store.put_over_corrupt", {{"id", int64_t(id)}, {"err", std::string(e.what())}});
        return PutResult::VersionConflict;
    }
    if (expected_version == 0) {
        if (current) return PutResult::VersionConflict;
    } else if (!current || current->version != expected_version) {
        return PutResult::VersionConflict;
    }
    write_atomic(record_path(id), encode_record(record));
    return PutResult::Ok;
}

std::optional<model::EventRecord> FileStore::get(uint64_t id) {
    std::lock_guard<std::mutex> lk(stripe(id));
    return read_unlocked(id);
}

ScanResult FileStore::scan() {
    ScanResult out;
    std::vector<uint64_t> ids;
    boost::system::error_code ec;
    for (fs::directory_iterator it(events_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        auto id = id_from_filename(name);
        if (!id) {
            observability::log_warn("store.stray_file", {{"file", name}});
            continue;
        }
        ids.push_back(*id);
    }
    if (ec) throw StoreError("list " + events_dir_ + ": " + ec.message());
    std::sort(ids.begin(), ids.end());

    for (uint64_t id : ids) {
        try {
            auto rec = get(id);
            if (rec) out.records.push_back(std::move(*rec));
        } catch (const CorruptRecord& e) {
            observability::log_warn("store.corrupt_record", {{"id", int64_t(id)}, {"err", std::string(e.what())}});
            ++out.corrupt;
        }
    }
    return out;
}

bool FileStore::remove(uint64_t id) {
    std::lock_guard<std::mutex> lk(stripe(id));
    boost::system::error_code ec;
    bool removed = fs::remove(record_path(id), ec);
    if (ec) throw StoreError("remove " + record_path(id) + ": " + ec.message());
    if (removed) fsync_dir(events_dir_);
    return removed;
}

}
