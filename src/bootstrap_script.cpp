#include "bootstrap_script.hpp"
#include "location.hpp"
#include "mounted_shares.hpp"
#include <format>
#include <vector>
#include <algorithm>

namespace {

// fstab fields are whitespace separated; octal escapes keep a value in one field
std::string fstabEscape(std::string_view value) {
    std::string out;
    for (char c : value) {
        switch (c) {
        case ' ':
            out += "\\040";
            break;
        case '\t':
            out += "\\011";
            break;
        case '\\':
            out += "\\134";
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::vector<OnPremLocation> distinctShares(const Location& source, const Location& target) {
    std::vector<OnPremLocation> shares;
    for (const auto* location : {&source, &target}) {
        if (const auto* share = std::get_if<OnPremLocation>(location)) {
            bool seen = std::ranges::any_of(shares, [&](const OnPremLocation& other) {
                return other.address == share->address && other.share == share->share;
            });
            if (!seen) {
                shares.push_back(*share);
            }
        }
    }
    return shares;
}

} // namespace

std::string shellQuote(std::string_view value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

std::expected<std::string, Error> buildBootstrapScript(const std::string& source,
                                                       const std::string& target,
                                                       const std::string& handler,
                                                       const Credentials& credentials,
                                                       const BootstrapSettings& settings) {
    auto sourceLocation = parseLocation(source);
    if (!sourceLocation) {
        return std::unexpected(sourceLocation.error());
    }
    auto targetLocation = parseLocation(target);
    if (!targetLocation) {
        return std::unexpected(targetLocation.error());
    }
    if (credentials.username().find(',') != std::string::npos || credentials.password().find(',') != std::string::npos) {
        return std::unexpected(Error{ErrorKind::Configuration,
            "Share credentials contain ',' which cifs mount options cannot carry"});
    }

    std::string mountOptions = std::format("username={},password={},dir_mode=0777,file_mode=0777,noperm",
        fstabEscape(credentials.username()), fstabEscape(credentials.password()));

    std::string script;
    script += "#!/bin/bash\n";
    script += "# FileShuttle transfer instance bootstrap. Runs once as root on first boot.\n\n";

    script += "# Mount on-premises shares\n";
    for (const auto& share : distinctShares(*sourceLocation, *targetLocation)) {
        std::string mountPoint = shareMountPoint(settings.mountRoot, share.address, share.share).string();
        std::string entry = std::format("{}  {}  cifs  {}  0  0",
            fstabEscape(std::format("//{}/{}", share.address, share.share)), fstabEscape(mountPoint), mountOptions);
        script += std::format("mkdir -p {}\n", shellQuote(mountPoint));
        std::string quoted = shellQuote(entry);
        script += std::format("echo {} >> /etc/fstab\n", quoted);
        secureWipe(entry);
        secureWipe(quoted);
    }
    script += "mount -a\n\n";

    script += "# Install runtime\n";
    script += std::format("yum install -y {}\n\n", settings.runtimePackages);

    script += "# Create log file\n";
    script += "mkdir -p /log\n";
    script += "filename=$(date \"+%Y%m%d-%H%M%S-%N\")_log.out\n";
    script += "date > \"/log/$filename\"\n\n";

    script += "# Execute file transfer\n";
    script += std::format("{} --source {} --target {} --mount-root {} >> \"/log/$filename\" 2>&1\n",
        shellQuote(handler), shellQuote(source), shellQuote(target), shellQuote(settings.mountRoot));
    script += "echo \"transfer exit status: $?\" >> \"/log/$filename\"\n";
    script += std::format("aws s3 cp \"/log/$filename\" {}\n\n", shellQuote(settings.auditLocation));

    script += "# Self-terminate\n";
    script += "shutdown -h now\n";

    secureWipe(mountOptions);
    return script;
}
