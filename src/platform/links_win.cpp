#include "link_strategy.hpp"
#include "platform.hpp"
#include <fmt/format.h>
#include <windows.h>

namespace fs = std::filesystem;

namespace platform {

namespace {

// Symlink creation needs developer mode or elevation; without it
// CreateSymbolicLink fails with ERROR_PRIVILEGE_NOT_HELD.
std::error_code normalize(const std::error_code& ec) {
    if (ec && ec.category() == std::system_category() &&
        ec.value() == ERROR_PRIVILEGE_NOT_HELD) {
        return std::make_error_code(std::errc::operation_not_permitted);
    }
    return ec;
}

class WindowsLinkStrategy : public LinkStrategy {
public:
    WindowsLinkStrategy() : native_(probe()) {}

    std::error_code create_link(const fs::path& source, const fs::path& target) override {
        if (!native_) return std::make_error_code(std::errc::operation_not_permitted);
        std::error_code ec;
        if (fs::is_directory(source, ec)) {
            fs::create_directory_symlink(source, target, ec);
        } else {
            fs::create_symlink(source, target, ec);
        }
        return normalize(ec);
    }

    std::error_code remove_link(const fs::path& target) override {
        std::error_code ec;
        if (!fs::is_symlink(fs::symlink_status(target, ec))) {
            return std::make_error_code(std::errc::invalid_argument);
        }
        fs::remove(target, ec);
        return ec;
    }

    bool supports_native_symlink() const override { return native_; }

    std::string name() const override {
        return native_ ? "windows-symlink" : "windows-copy";
    }

    std::string manual_instructions(const fs::path& source,
                                    const fs::path& target) const override {
        std::error_code ec;
        if (fs::is_directory(source, ec)) {
            return fmt::format("mklink /D \"{}\" \"{}\"", target.string(), source.string());
        }
        return fmt::format("mklink \"{}\" \"{}\"", target.string(), source.string());
    }

private:
    bool native_;

    static bool probe() {
        fs::path dir = temp_dir();
        fs::path src = dir / fmt::format("twin_probe_src_{}", GetCurrentProcessId());
        fs::path dst = dir / fmt::format("twin_probe_dst_{}", GetCurrentProcessId());
        std::error_code ec;
        fs::create_directories(src, ec);
        fs::create_directory_symlink(src, dst, ec);
        bool ok = !ec;
        fs::remove(dst, ec);
        fs::remove(src, ec);
        return ok;
    }
};

} // namespace

std::unique_ptr<LinkStrategy> make_native_link_strategy() {
    return std::make_unique<WindowsLinkStrategy>();
}

} // namespace platform
