#include "sink.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include "errors.hpp"

FileSink::FileSink(const std::string &path) : path(path)
{
    file.open(path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!file)
    {
        throw SinkError("Failed to open " + path + ": " + std::strerror(errno));
    }
}

void FileSink::write(const uint8_t *data, size_t len)
{
    file.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(len));
    if (!file)
    {
        throw SinkError("Failed to write to " + path);
    }
}

void FileSink::flush()
{
    file.flush();
    if (!file)
    {
        throw SinkError("Failed to flush " + path);
    }
}

void StdoutSink::write(const uint8_t *data, size_t len)
{
    std::cout.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(len));
    if (!std::cout)
    {
        throw SinkError("Failed to write to standard output");
    }
}

void StdoutSink::flush()
{
    std::cout.flush();
    if (!std::cout)
    {
        throw SinkError("Failed to flush standard output");
    }
}

DigestSink::DigestSink(Sink &inner, const std::vector<DigestAlgorithm> &algorithms) : inner(inner)
{
    for (auto algorithm : algorithms)
    {
        digests.push_back(std::make_unique<Digest>(algorithm));
    }
}

void DigestSink::write(const uint8_t *data, size_t len)
{
    inner.write(data, len);
    for (auto &digest : digests)
    {
        digest->update(data, len);
    }
}

void DigestSink::flush()
{
    inner.flush();
}

std::vector<std::pair<std::string, std::string>> DigestSink::finish()
{
    std::vector<std::pair<std::string, std::string>> results;
    for (auto &digest : digests)
    {
        results.emplace_back(digest_name(digest->get_algorithm()), digest->hex_digest());
    }
    return results;
}

std::unique_ptr<Sink> make_sink(bool to_stdout, const std::string &path)
{
    if (to_stdout)
    {
        return std::make_unique<StdoutSink>();
    }
    return std::make_unique<FileSink>(path);
}
