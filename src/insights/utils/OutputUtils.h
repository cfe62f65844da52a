#pragma once

#include <mutex>
#include <sstream>
#include <streambuf>
#include <ostream>

namespace ledgerinsights
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Lets diagnostics go to the console and a log file at the same time.
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
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Stream buffer that accepts and discards every character
 */
class NullBuf : public std::streambuf
{
protected:
    int overflow(int c) override;
};

/**
 * @brief Output stream that discards everything written to it
 *
 * Default diagnostics sink for callers that do not want analyzer logging.
 */
class NullStream : public std::ostream
{
public:
    NullStream();

private:
    NullBuf mNullBuf;
};

/**
 * @brief Output stream that collects text and hands it to a shared stream in one piece
 *
 * Everything written is kept in a private buffer. On destruction the buffer
 * is written to the target while holding targetMutex, so several threads
 * can each own a BufferedDiagnosticStream over the same target without
 * their lines interleaving.
 */
class BufferedDiagnosticStream : public std::ostream
{
public:
    BufferedDiagnosticStream(std::ostream& target, std::mutex& targetMutex);
    ~BufferedDiagnosticStream() override;

    BufferedDiagnosticStream(const BufferedDiagnosticStream&) = delete;
    BufferedDiagnosticStream& operator=(const BufferedDiagnosticStream&) = delete;

private:
    std::stringbuf mBuffer;
    std::ostream& mTarget;
    std::mutex& mTargetMutex;
};

} // namespace utils
} // namespace ledgerinsights
