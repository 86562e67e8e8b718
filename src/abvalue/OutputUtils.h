#pragma once

#include <fstream>
#include <memory>
#include <ostream>
#include <streambuf>
#include <string>

namespace abvalue {
namespace cli {

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously,
 *        typically the console and a log file.
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Where the report goes: the console alone, or the console and a log file.
 *
 * Owns the log file and the tee; stream() stays valid for the lifetime of
 * this object.
 */
class ReportOutput
{
public:
    explicit ReportOutput(std::ostream& console);

    /**
     * @throws std::runtime_error if the log file cannot be opened
     */
    ReportOutput(std::ostream& console, const std::string& logFilePath);

    ReportOutput(const ReportOutput&) = delete;
    ReportOutput& operator=(const ReportOutput&) = delete;

    std::ostream& stream();

private:
    std::ostream& mConsole;
    std::unique_ptr<std::ofstream> mLogFile;
    std::unique_ptr<TeeStream> mTee;
};

} // namespace cli
} // namespace abvalue
