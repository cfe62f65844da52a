#include "OutputUtils.h"
#include <cstdio>

namespace ledgerinsights
{
namespace utils
{

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

int NullBuf::overflow(int c)
{
    return (c == EOF) ? !EOF : c;
}

NullStream::NullStream()
    : std::ostream(nullptr),
      mNullBuf()
{
    this->rdbuf(&mNullBuf);
}

BufferedDiagnosticStream::BufferedDiagnosticStream(std::ostream& target, std::mutex& targetMutex)
    : std::ostream(nullptr),
      mBuffer(),
      mTarget(target),
      mTargetMutex(targetMutex)
{
    this->rdbuf(&mBuffer);
}

BufferedDiagnosticStream::~BufferedDiagnosticStream()
{
    const std::string text = mBuffer.str();
    if (text.empty())
    {
        return;
    }

    std::lock_guard<std::mutex> lock(mTargetMutex);
    mTarget << text;
    mTarget.flush();
}

} // namespace utils
} // namespace ledgerinsights
