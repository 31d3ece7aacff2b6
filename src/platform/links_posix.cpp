#include "link_strategy.hpp"
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace platform {

namespace {

class PosixLinkStrategy : public LinkStrategy {
public:
    std::error_code create_link(const fs::path& source, const fs::path& target) override {
        std::error_code ec;
        if (fs::is_directory(source, ec)) {
            fs::create_directory_symlink(source, target, ec);
        } else {
            fs::create_symlink(source, target, ec);
        }
        return ec;
    }

    std::error_code remove_link(const fs::path& target) override {
        std::error_code ec;
        if (!fs::is_symlink(fs::symlink_status(target, ec))) {
            return std::make_error_code(std::errc::invalid_argument);
        }
        fs::remove(target, ec);
        return ec;
    }

    bool supports_native_symlink() const override { return true; }

    std::string name() const override { return "posix-symlink"; }

    std::string manual_instructions(const fs::path& source,
                                    const fs::path& target) const override {
        return fmt::format("ln -s \"{}\" \"{}\"", source.string(), target.string());
    }
};

} // namespace

std::unique_ptr<LinkStrategy> make_native_link_strategy() {
    return std::make_unique<PosixLinkStrategy>();
}

} // namespace platform
