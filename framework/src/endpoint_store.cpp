#include <meridian/endpoint_store.h>
#include <meridian/exceptions.h>
#include <meridian/logger.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace meridian {

namespace {

    // RAII wrapper: releases the flock (if any) and closes the descriptor
    class FileHandle {
    public:
        explicit FileHandle(int fd) : fd_(fd) {}
        ~FileHandle() {
            if (fd_ >= 0) {
                if (locked_) ::flock(fd_, LOCK_UN);
                ::close(fd_);
            }
        }
        FileHandle(const FileHandle&) = delete;
        FileHandle& operator=(const FileHandle&) = delete;

        int get() const { return fd_; }
        bool valid() const { return fd_ >= 0; }

        bool lock(int operation) {
            int rc;
            do {
                rc = ::flock(fd_, operation);
            } while (rc < 0 && errno == EINTR);
            locked_ = (rc == 0);
            return locked_;
        }

    private:
        int fd_;
        bool locked_{false};
    };

    std::string errno_message(const std::string& what) {
        return what + ": " + std::strerror(errno);
    }

    bool read_all(int fd, std::string& out) {
        out.clear();
        char buf[8192];
        while (true) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            if (n == 0) break;
            out.append(buf, static_cast<size_t>(n));
        }
        return true;
    }

    bool write_all(int fd, const std::string& content, std::string& error) {
        size_t written = 0;
        while (written < content.size()) {
            ssize_t n = ::write(fd, content.data() + written, content.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                error = errno_message("write");
                return false;
            }
            written += static_cast<size_t>(n);
        }
        return true;
    }

    // Caller must hold LOCK_EX on the lock file. The data file is only ever
    // swapped by rename(), so a failed write leaves the previous content in place.
    bool replace_content(const std::filesystem::path& path, const std::string& content, std::string& error) {
        const std::filesystem::path tmp = path.string() + ".tmp";

        FileHandle file(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
        if (!file.valid()) {
            error = errno_message("open " + tmp.string());
            return false;
        }

        bool ok = write_all(file.get(), content, error);
        if (ok && ::fsync(file.get()) < 0) {
            error = errno_message("fsync");
            ok = false;
        }
        if (ok && ::rename(tmp.c_str(), path.c_str()) < 0) {
            error = errno_message("rename");
            ok = false;
        }
        if (!ok) {
            ::unlink(tmp.c_str());
            return false;
        }

        // Make the rename itself durable
        std::filesystem::path dir = path.parent_path();
        FileHandle dir_handle(::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
        if (dir_handle.valid()) {
            ::fsync(dir_handle.get());
        }
        return true;
    }

    FileHandle open_lock(const std::filesystem::path& lock_path) {
        return FileHandle(::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
    }

} // namespace

EndpointStore::EndpointStore(std::filesystem::path path)
    : path_(std::move(path)), lock_path_(path_.string() + ".lock") {}

EndpointSnapshot EndpointStore::load() const {
    FileHandle lock = open_lock(lock_path_);
    if (!lock.valid()) {
        throw ConfigLoadFailed(errno_message("Cannot open " + lock_path_.string()));
    }
    if (!lock.lock(LOCK_SH)) {
        throw ConfigLoadFailed(errno_message("Cannot lock " + lock_path_.string()));
    }

    FileHandle file(::open(path_.c_str(), O_RDONLY | O_CLOEXEC));
    if (!file.valid()) {
        throw ConfigLoadFailed(errno_message("Cannot open " + path_.string()));
    }

    std::string content;
    if (!read_all(file.get(), content)) {
        throw ConfigLoadFailed(errno_message("Cannot read " + path_.string()));
    }

    return parse_endpoints(content);
}

bool EndpointStore::persist(const EndpointSnapshot& records) const {
    if (records.empty()) {
        Logger::instance().debug("Endpoint snapshot is empty, nothing persisted");
        return false;
    }

    FileHandle lock = open_lock(lock_path_);
    if (!lock.valid() || !lock.lock(LOCK_EX)) {
        Logger::instance().log_error(errno_message("Cannot lock " + lock_path_.string()));
        return false;
    }

    std::string error;
    if (!replace_content(path_, serialize_endpoints(records), error)) {
        Logger::instance().log_error("Writing " + path_.string() + " failed: " + error);
        return false;
    }
    return true;
}

bool EndpointStore::update(const Transform& transform, const EndpointSnapshot& fallback) const {
    FileHandle lock = open_lock(lock_path_);
    if (!lock.valid() || !lock.lock(LOCK_EX)) {
        Logger::instance().log_error(errno_message("Cannot lock " + lock_path_.string()));
        return false;
    }

    EndpointSnapshot current = fallback;
    FileHandle file(::open(path_.c_str(), O_RDONLY | O_CLOEXEC));
    if (file.valid()) {
        std::string content;
        if (!read_all(file.get(), content)) {
            Logger::instance().log_error(errno_message("Cannot read " + path_.string()));
            return false;
        }
        if (!content.empty()) {
            try {
                current = parse_endpoints(content);
            } catch (const ConfigLoadFailed& e) {
                Logger::instance().warn(std::string("Endpoint file unreadable during update, using in-memory snapshot: ") + e.what());
            }
        }
    } else if (errno != ENOENT) {
        Logger::instance().log_error(errno_message("Cannot open " + path_.string() + " for update"));
        return false;
    }

    auto updated = transform(current);
    if (!updated || updated->empty()) {
        return false;
    }

    std::string error;
    if (!replace_content(path_, serialize_endpoints(*updated), error)) {
        Logger::instance().log_error("Writing " + path_.string() + " failed: " + error);
        return false;
    }
    return true;
}

} // namespace meridian
