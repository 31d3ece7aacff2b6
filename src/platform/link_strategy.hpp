#pragma once

#include <string>
#include <memory>
#include <filesystem>
#include <system_error>
#include <core/types.hpp>

namespace platform {

// How a file relationship is materialized on this OS. Chosen once by
// make_link_strategy() and handed to every symlink effect.
class LinkStrategy {
public:
    virtual ~LinkStrategy() = default;

    // Create a native link at target pointing to source. Directory sources
    // get a directory link. Parent directories must already exist.
    virtual std::error_code create_link(const std::filesystem::path& source,
                                        const std::filesystem::path& target) = 0;

    // Remove the link at target without following it.
    // Fails with errc::invalid_argument if target is not a link.
    virtual std::error_code remove_link(const std::filesystem::path& target) = 0;

    virtual bool supports_native_symlink() const = 0;

    virtual std::string name() const = 0;

    // Shell command a user can run to create the link by hand.
    virtual std::string manual_instructions(const std::filesystem::path& source,
                                            const std::filesystem::path& target) const = 0;
};

// Strategy that never links; symlink effects always fall back to copying.
class CopyLinkStrategy : public LinkStrategy {
public:
    std::error_code create_link(const std::filesystem::path& source,
                                const std::filesystem::path& target) override;
    std::error_code remove_link(const std::filesystem::path& target) override;
    bool supports_native_symlink() const override { return false; }
    std::string name() const override { return "copy"; }
    std::string manual_instructions(const std::filesystem::path& source,
                                    const std::filesystem::path& target) const override;
};

// Privilege or unsupported-operation errors that warrant a copy fallback.
bool is_fallback_error(const std::error_code& ec);

// Recursively copy a file or directory, preserving permission bits.
// An existing target is overwritten.
std::error_code copy_path(const std::filesystem::path& source,
                          const std::filesystem::path& target);

// Remove whatever sits at path (file, link, or directory tree) without
// following links. Missing paths are not an error.
std::error_code remove_entry(const std::filesystem::path& path);

// The native strategy of the build platform (links_posix.cpp / links_win.cpp).
std::unique_ptr<LinkStrategy> make_native_link_strategy();

// Factory used at startup: LinkMode::Copy forces copies everywhere.
std::unique_ptr<LinkStrategy> make_link_strategy(LinkMode mode);

} // namespace platform
