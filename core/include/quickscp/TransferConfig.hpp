// Assembly and validation of the TransferConfig from raw console input.
#pragma once
#include "ScpTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace quickscp {

// Raw answers as typed by the user. Optional fields may be empty.
struct RawTransferInput {
    std::string localFilePath;
    std::string remoteHost;
    std::string port;
    std::string username;
    std::string remotePath;
};

// True if `path` names an existing regular file. Fills err otherwise.
bool validateLocalFile(const std::string& path, std::string& err);

// Empty -> 22. Unparsable or out of range -> 22 and `invalid` set to true.
std::uint16_t parsePort(const std::string& raw, bool& invalid);

// "/home/{username}/{basename(localFilePath)}"
std::string defaultRemotePath(const std::string& username,
                              const std::string& localFilePath);

// Builds the immutable config. Warnings (e.g. bad port) are appended to
// `warnings` and do not fail the build.
bool buildTransferConfig(const RawTransferInput& in,
                         TransferConfig& out,
                         std::string& err,
                         std::vector<std::string>& warnings);

} // namespace quickscp
