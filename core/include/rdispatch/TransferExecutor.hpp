// Remote mutations needed to realise a transfer plan.
#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace rdispatch {

class TransferExecutor {
public:
    using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;

    virtual ~TransferExecutor() = default;

    // Creates a single directory; the parent must already exist.
    virtual bool createDirectory(const std::string& remote_dir,
                                 std::string& err,
                                 unsigned int mode = 0755) = 0;

    // Uploads a local file, creating or truncating the remote one.
    virtual bool uploadFile(const std::string& local,
                            const std::string& remote,
                            std::string& err,
                            ProgressCB progress = {}) = 0;
};

} // namespace rdispatch
