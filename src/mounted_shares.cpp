#include "mounted_shares.hpp"
#include <fstream>
#include <format>

namespace fs = std::filesystem;

namespace {

class MountedShareConnection : public SmbConnection {
public:
    MountedShareConnection(const MountedShares& shares, std::string address)
        : shares_(shares), address_(std::move(address)) {}

    std::expected<size_t, std::string> retrieveFile(const std::string& share,
                                                    const std::string& path,
                                                    std::ostream& out) override {
        return shares_.readFile(OnPremLocation{address_, share, path}, out);
    }

private:
    const MountedShares& shares_;
    std::string address_;
};

} // namespace

fs::path shareMountPoint(const fs::path& root, const std::string& address, const std::string& share) {
    return root / address / share;
}

MountedShares::MountedShares(fs::path root) : root_(std::move(root)) {}

std::expected<fs::path, std::string> MountedShares::pathFor(const OnPremLocation& location) const {
    const auto& share = location.share;
    if (share.empty() || share == "." || share == ".." || share.find('/') != std::string::npos) {
        return std::unexpected(std::format("Invalid share name '{}'", share));
    }
    fs::path mountPoint = shareMountPoint(root_, location.address, share).lexically_normal();
    if (location.path.empty()) {
        return mountPoint;
    }
    // an absolute or dot-dot path would otherwise land outside the share
    fs::path path = (mountPoint / location.path).lexically_normal();
    auto relative = path.lexically_relative(mountPoint);
    if (relative.empty() || *relative.begin() == "..") {
        return std::unexpected(std::format("Location {}/{}/{} is outside its mounted share",
            location.address, share, location.path));
    }
    return path;
}

std::expected<size_t, std::string> MountedShares::readFile(const OnPremLocation& location, std::ostream& out) const {
    auto contained = pathFor(location);
    if (!contained) {
        return std::unexpected(contained.error());
    }
    fs::path path = *contained;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(std::format("Not a file on the mounted share: {}", path.string()));
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::unexpected(std::format("Failed to open mounted file: {}", path.string()));
    }

    size_t total = 0;
    char buf[8192];
    while (input) {
        input.read(buf, sizeof(buf));
        out.write(buf, input.gcount());
        total += static_cast<size_t>(input.gcount());
    }
    if (input.bad() || !out) {
        return std::unexpected(std::format("Failed while reading mounted file: {}", path.string()));
    }
    return total;
}

std::expected<size_t, std::string> MountedShares::writeFile(const OnPremLocation& location,
                                                            const std::string& fileName,
                                                            std::istream& in) const {
    auto contained = pathFor(location);
    if (!contained) {
        return std::unexpected(contained.error());
    }
    fs::path path = *contained;
    if (location.path.empty() || location.path.back() == '/') {
        if (fileName.empty()) {
            return std::unexpected(std::format("No file name to write into {}", path.string()));
        }
        path /= fileName;
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create directory {}: {}", path.parent_path().string(), ec.message()));
    }
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return std::unexpected(std::format("Failed to open mounted file for writing: {}", path.string()));
    }

    size_t total = 0;
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        output.write(buf, in.gcount());
        total += static_cast<size_t>(in.gcount());
    }
    output.flush();
    if (!output) {
        return std::unexpected(std::format("Failed while writing mounted file: {}", path.string()));
    }
    return total;
}

MountedShareConnector::MountedShareConnector(const MountedShares& shares) : shares_(shares) {}

std::expected<std::unique_ptr<SmbConnection>, Error> MountedShareConnector::connect(const std::string& address) {
    std::error_code ec;
    if (!fs::is_directory(shares_.root() / address, ec)) {
        return std::unexpected(Error{ErrorKind::Transfer,
            std::format("No shares from {} are mounted under {}", address, shares_.root().string())});
    }
    return std::make_unique<MountedShareConnection>(shares_, address);
}
