#include "infrastructure/FfmpegDecoder.hpp"

#include <vector>

namespace audiovault::infrastructure {

FfmpegDecoder::FfmpegDecoder(std::string binary, std::chrono::milliseconds timeout)
    : m_binary(std::move(binary))
    , m_timeout(timeout)
    , m_available(ProcessRunner::FindExecutable(m_binary).has_value())
{}

CommandResult FfmpegDecoder::decode(const std::string& inputPath,
                                    const std::string& outputPath,
                                    int sampleRate,
                                    std::optional<std::uint64_t> exactSamples) const {
    std::vector<std::string> cmd = {
        m_binary,
        "-y",
        "-loglevel", "error",
        "-i", inputPath
    };
    if (exactSamples && *exactSamples > 0) {
        // Resample first so the sample counts below are at the output rate.
        const std::string n = std::to_string(*exactSamples);
        cmd.push_back("-af");
        cmd.push_back("aresample=" + std::to_string(sampleRate) +
                      ",apad=whole_len=" + n + ",atrim=end_sample=" + n);
    }
    cmd.insert(cmd.end(), {
        "-c:a", "pcm_s16le",
        "-ar", std::to_string(sampleRate),
        "-ac", "1",
        outputPath
    });
    return ProcessRunner::Run(cmd, m_timeout);
}

} // namespace audiovault::infrastructure
