#ifndef SINK_HPP
#define SINK_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "crypto/digest.hpp"

// Destination for payload bytes, written strictly in stream order.
class Sink
{
public:
    virtual ~Sink() = default;
    virtual void write(const uint8_t *data, size_t len) = 0;
    virtual void flush() = 0;
};

class FileSink : public Sink
{
private:
    std::ofstream file;
    std::string path;

public:
    explicit FileSink(const std::string &path);
    void write(const uint8_t *data, size_t len) override;
    void flush() override;
};

class StdoutSink : public Sink
{
public:
    void write(const uint8_t *data, size_t len) override;
    void flush() override;
};

// Forwards to another sink while hashing everything that passes through.
class DigestSink : public Sink
{
private:
    Sink &inner;
    std::vector<std::unique_ptr<Digest>> digests;

public:
    DigestSink(Sink &inner, const std::vector<DigestAlgorithm> &algorithms);
    void write(const uint8_t *data, size_t len) override;
    void flush() override;

    // Finalizes every digest; returns (algorithm name, lowercase hex) pairs.
    std::vector<std::pair<std::string, std::string>> finish();
};

std::unique_ptr<Sink> make_sink(bool to_stdout, const std::string &path);

#endif
