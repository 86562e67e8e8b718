#include "OutputUtils.h"
#include <stdexcept>

namespace abvalue {
namespace cli {

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

ReportOutput::ReportOutput(std::ostream& console)
    : mConsole(console)
{
}

ReportOutput::ReportOutput(std::ostream& console, const std::string& logFilePath)
    : mConsole(console),
      mLogFile(std::make_unique<std::ofstream>(logFilePath))
{
    if (!mLogFile->is_open())
        throw std::runtime_error("Cannot open log file for writing: " + logFilePath);

    mTee = std::make_unique<TeeStream>(mConsole, *mLogFile);
}

std::ostream& ReportOutput::stream()
{
    if (mTee)
        return *mTee;
    return mConsole;
}

} // namespace cli
} // namespace abvalue
