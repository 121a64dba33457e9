#include "WavEncoder.hpp"
#include "sndfile.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

// In-memory file for sf_open_virtual. Writes land at the current position so
// libsndfile can seek back and patch the header sizes on close.
struct MemoryFile {
    std::vector<uint8_t> bytes;
    sf_count_t position = 0;
};

struct MemoryView {
    const uint8_t* data = nullptr;
    sf_count_t size = 0;
    sf_count_t position = 0;
};

sf_count_t Seek(sf_count_t offset, int whence, sf_count_t current, sf_count_t size) {
    sf_count_t target = current;
    switch (whence) {
        case SEEK_SET: target = offset; break;
        case SEEK_CUR: target = current + offset; break;
        case SEEK_END: target = size + offset; break;
        default: return -1;
    }
    return target < 0 ? -1 : target;
}

sf_count_t FileLength(void* user) {
    return static_cast<sf_count_t>(static_cast<MemoryFile*>(user)->bytes.size());
}

sf_count_t FileSeek(sf_count_t offset, int whence, void* user) {
    auto* file = static_cast<MemoryFile*>(user);
    sf_count_t target = Seek(offset, whence, file->position, static_cast<sf_count_t>(file->bytes.size()));
    if (target >= 0) {
        file->position = target;
    }
    return target;
}

sf_count_t FileRead(void* ptr, sf_count_t count, void* user) {
    auto* file = static_cast<MemoryFile*>(user);
    sf_count_t available = static_cast<sf_count_t>(file->bytes.size()) - file->position;
    sf_count_t n = std::max<sf_count_t>(0, std::min(count, available));
    if (n > 0) {
        std::memcpy(ptr, file->bytes.data() + file->position, static_cast<size_t>(n));
        file->position += n;
    }
    return n;
}

sf_count_t FileWrite(const void* ptr, sf_count_t count, void* user) {
    auto* file = static_cast<MemoryFile*>(user);
    size_t end = static_cast<size_t>(file->position + count);
    if (end > file->bytes.size()) {
        file->bytes.resize(end);
    }
    std::memcpy(file->bytes.data() + file->position, ptr, static_cast<size_t>(count));
    file->position += count;
    return count;
}

sf_count_t FileTell(void* user) {
    return static_cast<MemoryFile*>(user)->position;
}

sf_count_t ViewLength(void* user) {
    return static_cast<MemoryView*>(user)->size;
}

sf_count_t ViewSeek(sf_count_t offset, int whence, void* user) {
    auto* view = static_cast<MemoryView*>(user);
    sf_count_t target = Seek(offset, whence, view->position, view->size);
    if (target >= 0) {
        view->position = std::min(target, view->size);
    }
    return target < 0 ? target : view->position;
}

sf_count_t ViewRead(void* ptr, sf_count_t count, void* user) {
    auto* view = static_cast<MemoryView*>(user);
    sf_count_t n = std::max<sf_count_t>(0, std::min(count, view->size - view->position));
    if (n > 0) {
        std::memcpy(ptr, view->data + view->position, static_cast<size_t>(n));
        view->position += n;
    }
    return n;
}

sf_count_t ViewWrite(const void*, sf_count_t, void*) {
    return 0;
}

sf_count_t ViewTell(void* user) {
    return static_cast<MemoryView*>(user)->position;
}

struct SndfileCloser {
    void operator()(SNDFILE* file) const noexcept {
        if (file) {
            sf_close(file);
        }
    }
};

using SndfilePtr = std::unique_ptr<SNDFILE, SndfileCloser>;

SndfilePtr OpenForReading(MemoryView& view, SF_INFO& info) {
    static SF_VIRTUAL_IO io = {ViewLength, ViewSeek, ViewRead, ViewWrite, ViewTell};
    std::memset(&info, 0, sizeof(info));

    SndfilePtr file(sf_open_virtual(&io, SFM_READ, &info, &view));
    if (!file) {
        throw std::runtime_error(std::string("Could not parse WAV data: ") + sf_strerror(nullptr));
    }
    if ((info.format & SF_FORMAT_TYPEMASK) != SF_FORMAT_WAV) {
        throw std::runtime_error("Data is not a WAV container");
    }
    return file;
}

} // namespace

int16_t QuantizeSample(float sample) {
    if (std::isnan(sample)) {
        return 0;
    }
    double s = std::max(-1.0, std::min(1.0, static_cast<double>(sample)));
    double scaled = s < 0 ? s * 32768.0 : s * 32767.0;
    return static_cast<int16_t>(std::lround(scaled));
}

std::vector<uint8_t> EncodeWav(const float* samples, size_t numSamples, unsigned int sampleRate) {
    if (sampleRate == 0) {
        throw std::invalid_argument("Sample rate must be specified");
    }

    std::vector<int16_t> pcm(numSamples);
    for (size_t i = 0; i < numSamples; ++i) {
        pcm[i] = QuantizeSample(samples[i]);
    }

    SF_INFO sfinfo;
    std::memset(&sfinfo, 0, sizeof(sfinfo));
    sfinfo.samplerate = static_cast<int>(sampleRate);
    sfinfo.channels = 1;
    sfinfo.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    static SF_VIRTUAL_IO io = {FileLength, FileSeek, FileRead, FileWrite, FileTell};
    MemoryFile memory;

    SNDFILE* outfile = sf_open_virtual(&io, SFM_WRITE, &sfinfo, &memory);
    if (!outfile) {
        throw std::runtime_error(std::string("Could not open WAV encoder: ") + sf_strerror(nullptr));
    }

    sf_count_t written = pcm.empty() ? 0 : sf_write_short(outfile, pcm.data(), static_cast<sf_count_t>(pcm.size()));
    int closeResult = sf_close(outfile);

    if (written != static_cast<sf_count_t>(pcm.size())) {
        throw std::runtime_error("WAV encoder wrote " + std::to_string(written) + " samples, expected "
                                 + std::to_string(pcm.size()));
    }
    if (closeResult != 0) {
        throw std::runtime_error(std::string("WAV encoder failed to finalize: ") + sf_error_number(closeResult));
    }

    return std::move(memory.bytes);
}

std::vector<uint8_t> EncodeWav(const std::vector<float>& samples, unsigned int sampleRate) {
    return EncodeWav(samples.data(), samples.size(), sampleRate);
}

WavInfo ReadWavInfo(const std::vector<uint8_t>& bytes) {
    MemoryView view;
    view.data = bytes.data();
    view.size = static_cast<sf_count_t>(bytes.size());

    SF_INFO sfinfo;
    SndfilePtr file = OpenForReading(view, sfinfo);

    WavInfo info;
    info.sampleRate = static_cast<unsigned int>(sfinfo.samplerate);
    info.numChannels = static_cast<unsigned int>(sfinfo.channels);
    switch (sfinfo.format & SF_FORMAT_SUBMASK) {
        case SF_FORMAT_PCM_U8: info.bitsPerSample = 8; break;
        case SF_FORMAT_PCM_16: info.bitsPerSample = 16; break;
        case SF_FORMAT_PCM_24: info.bitsPerSample = 24; break;
        case SF_FORMAT_PCM_32:
        case SF_FORMAT_FLOAT: info.bitsPerSample = 32; break;
        case SF_FORMAT_DOUBLE: info.bitsPerSample = 64; break;
        default: info.bitsPerSample = 0; break;
    }
    info.frames = static_cast<uint64_t>(sfinfo.frames);
    return info;
}

std::vector<int16_t> DecodeWav(const std::vector<uint8_t>& bytes) {
    MemoryView view;
    view.data = bytes.data();
    view.size = static_cast<sf_count_t>(bytes.size());

    SF_INFO sfinfo;
    SndfilePtr file = OpenForReading(view, sfinfo);

    std::vector<int16_t> samples(static_cast<size_t>(sfinfo.frames) * static_cast<size_t>(sfinfo.channels));
    if (!samples.empty()) {
        sf_count_t read = sf_read_short(file.get(), samples.data(), static_cast<sf_count_t>(samples.size()));
        samples.resize(static_cast<size_t>(std::max<sf_count_t>(0, read)));
    }
    return samples;
}
