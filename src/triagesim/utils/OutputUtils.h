// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace triagesim
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to log to the console and a log file at the same time.
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
 * @brief Path of fileName inside outputDir, creating the directory if needed
 * @throws std::runtime_error if the directory cannot be created
 */
std::string createOutputFilePath(const std::string& outputDir, const std::string& fileName);

/**
 * @brief Format a duration in whole seconds as HH:MM:SS
 */
std::string formatElapsedTime(long long totalSeconds);

} // namespace utils
} // namespace triagesim
