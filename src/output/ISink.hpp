#pragma once

#include <filesystem>
#include <string>

namespace output
{

enum class WriteMode
{
    Replace,
    Append
};

struct WriteTask
{
    std::filesystem::path path;
    std::string content;
    // Only honored in Replace mode, and at most once per destination.
    bool backup = false;
    WriteMode mode = WriteMode::Replace;
};

class ISink
{
public:
    virtual ~ISink() = default;
    virtual void submit(WriteTask task) = 0;
};

} // namespace output
