#include "link_strategy.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace platform {

std::error_code CopyLinkStrategy::create_link(const fs::path&, const fs::path&) {
    return std::make_error_code(std::errc::operation_not_supported);
}

std::error_code CopyLinkStrategy::remove_link(const fs::path& target) {
    std::error_code ec;
    if (!fs::is_symlink(fs::symlink_status(target, ec))) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    fs::remove(target, ec);
    return ec;
}

std::string CopyLinkStrategy::manual_instructions(const fs::path& source,
                                                  const fs::path& target) const {
    return fmt::format("cp -R \"{}\" \"{}\"", source.string(), target.string());
}

bool is_fallback_error(const std::error_code& ec) {
    if (!ec) return false;
    return ec == std::errc::permission_denied ||
           ec == std::errc::operation_not_permitted ||
           ec == std::errc::operation_not_supported ||
           ec == std::errc::function_not_supported ||
           ec == std::errc::not_supported;
}

static std::error_code sync_permissions(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    auto perms = fs::status(source, ec).permissions();
    if (ec) return ec;
    fs::permissions(target, perms, fs::perm_options::replace, ec);
    return ec;
}

std::error_code copy_path(const fs::path& source, const fs::path& target) {
    std::error_code ec;

    if (!fs::is_directory(source, ec)) {
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        if (ec) return ec;
        return sync_permissions(source, target);
    }

    fs::copy(source, target,
             fs::copy_options::recursive | fs::copy_options::overwrite_existing |
             fs::copy_options::copy_symlinks, ec);
    if (ec) return ec;

    // fs::copy creates directories with default mode; carry the source bits over.
    if ((ec = sync_permissions(source, target))) return ec;
    for (auto it = fs::recursive_directory_iterator(source, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_symlink()) continue;
        auto rel = fs::relative(it->path(), source, ec);
        if (ec) return ec;
        if ((ec = sync_permissions(it->path(), target / rel))) return ec;
    }
    return ec;
}

std::error_code remove_entry(const fs::path& path) {
    std::error_code ec;
    auto st = fs::symlink_status(path, ec);
    if (st.type() == fs::file_type::not_found) return {};
    if (ec) return ec;
    if (fs::is_directory(st)) {
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }
    return ec;
}

std::unique_ptr<LinkStrategy> make_link_strategy(LinkMode mode) {
    std::unique_ptr<LinkStrategy> strategy;
    if (mode == LinkMode::Copy) {
        strategy = std::make_unique<CopyLinkStrategy>();
    } else {
        strategy = make_native_link_strategy();
    }
    twin_log(fmt::format("link strategy={} native={}", strategy->name(),
                         strategy->supports_native_symlink()));
    return strategy;
}

} // namespace platform
