#include "tailroute/delivery_channel.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

#include "tailroute/errors.hpp"

namespace tailroute {

namespace {

/** @brief Owns a POSIX descriptor until close() or destruction. */
class FileDescriptor final {
  public:
    explicit FileDescriptor(int descriptor) : descriptor_(descriptor) {}
    ~FileDescriptor() {
        if (descriptor_ >= 0) {
            ::close(descriptor_);
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const noexcept {
        return descriptor_;
    }

    /** @brief Close now and report failure. */
    int close() noexcept {
        const int result = ::close(descriptor_);
        descriptor_ = -1;
        return result;
    }

  private:
    int descriptor_;
};

[[noreturn]] void fail(const std::string& action, const std::filesystem::path& path, int error_number) {
    throw DeliveryError(fmt::format("Unable to {} {}: {}", action, path.string(), std::strerror(error_number)));
}

void write_all(int descriptor, const std::string& body, const std::filesystem::path& path) {
    std::size_t offset = 0;
    while (offset < body.size()) {
        const ssize_t written = ::write(descriptor, body.data() + offset, body.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            fail("write", path, errno);
        }
        offset += static_cast<std::size_t>(written);
    }
}

}  // namespace

void HttpDeliveryChannel::deliver(const PublishedConfigurationPtr& published) {
    if (!published) {
        throw DeliveryError("Refusing to deliver an empty configuration");
    }
    current_.store(published);
}

PublishedConfigurationPtr HttpDeliveryChannel::current() const noexcept {
    return current_.load();
}

FileDeliveryChannel::FileDeliveryChannel(std::filesystem::path path_output)
    : path_output_(std::move(path_output)), logger_(get_logger()) {}

const std::filesystem::path& FileDeliveryChannel::output_path() const noexcept {
    return path_output_;
}

void FileDeliveryChannel::deliver(const PublishedConfigurationPtr& published) {
    if (!published) {
        throw DeliveryError("Refusing to deliver an empty configuration");
    }

    std::filesystem::path path_directory = path_output_.parent_path();
    if (path_directory.empty()) {
        path_directory = ".";
    }
    std::error_code error_directory;
    std::filesystem::create_directories(path_directory, error_directory);
    if (error_directory) {
        throw DeliveryError(fmt::format("Unable to create {}: {}", path_directory.string(), error_directory.message()));
    }

    // Temp file lives beside the target so rename() stays on one filesystem.
    std::string str_template = (path_directory / ("." + path_output_.filename().string() + ".XXXXXX")).string();
    FileDescriptor descriptor{::mkstemp(str_template.data())};
    if (descriptor.get() < 0) {
        fail("create temp file in", path_directory, errno);
    }
    const std::filesystem::path path_temp{str_template};

    try {
        write_all(descriptor.get(), published->body, path_temp);
        if (::fchmod(descriptor.get(), 0644) != 0) {
            fail("set permissions on", path_temp, errno);
        }
        if (::fsync(descriptor.get()) != 0) {
            fail("flush", path_temp, errno);
        }
        if (descriptor.close() != 0) {
            fail("close", path_temp, errno);
        }
        if (::rename(path_temp.c_str(), path_output_.c_str()) != 0) {
            fail("rename temp file over", path_output_, errno);
        }
    } catch (const DeliveryError&) {
        std::error_code error_remove;
        std::filesystem::remove(path_temp, error_remove);
        throw;
    }

    logger_->info(
        R"({{"component":"delivery","event":"file_written","path":{},"version":{},"bytes":{}}})",
        json_string(path_output_.string()),
        published->version,
        published->body.size()
    );
}

}  // namespace tailroute
