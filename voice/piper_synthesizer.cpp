#include "voice/piper_synthesizer.hpp"
#include "audio/resample.hpp"
#include "logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Parley {

// ~250ms of audio at 22.05 kHz per batch
static constexpr size_t kBatchBytes = 11025;

static void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

PiperSynthesizer::PiperSynthesizer(PiperConfig config)
    : config_(std::move(config)) {}

void PiperSynthesizer::synthesize(const std::string& text, const BatchCallback& onBatch) {
    int toChild[2] = {-1, -1};
    int fromChild[2] = {-1, -1};
    if (::pipe(toChild) != 0 || ::pipe(fromChild) != 0) {
        closeFd(toChild[0]); closeFd(toChild[1]);
        closeFd(fromChild[0]); closeFd(fromChild[1]);
        throw std::runtime_error(std::string("pipe() failed: ") + std::strerror(errno));
    }

    // argv is built before fork: nothing may allocate in the child
    std::vector<std::string> args{config_.executable, "--model", config_.modelPath, "--output_raw"};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        closeFd(toChild[0]); closeFd(toChild[1]);
        closeFd(fromChild[0]); closeFd(fromChild[1]);
        throw std::runtime_error(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::dup2(toChild[0], STDIN_FILENO);
        ::dup2(fromChild[1], STDOUT_FILENO);
        ::close(toChild[0]); ::close(toChild[1]);
        ::close(fromChild[0]); ::close(fromChild[1]);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    closeFd(toChild[0]);
    closeFd(fromChild[1]);
    LOG_TRACE("Piper", "Spawned " + config_.executable + " (pid " + std::to_string(pid) + ")");

    // Piper reads one line per utterance
    std::string line = text;
    for (char& c : line) if (c == '\n' || c == '\r') c = ' ';
    line.push_back('\n');

    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = ::write(toChild[1], line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;   // child gone; its exit status tells why
        }
        written += static_cast<size_t>(n);
    }
    closeFd(toChild[1]);

    std::vector<char> buffer(kBatchBytes);
    std::vector<char> pending;   // odd byte carried between reads
    bool cancelled = false;
    size_t totalSamples = 0;

    while (!cancelled) {
        ssize_t n = ::read(fromChild[0], buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;

        pending.insert(pending.end(), buffer.begin(), buffer.begin() + n);
        const size_t usable = pending.size() & ~static_cast<size_t>(1);
        if (usable == 0) continue;

        std::vector<short> pcm(usable / 2);
        std::memcpy(pcm.data(), pending.data(), usable);
        pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(usable));

        totalSamples += pcm.size();
        if (!onBatch(pcm16ToFloat(pcm.data(), pcm.size()), config_.sampleRate)) {
            cancelled = true;
        }
    }
    closeFd(fromChild[0]);

    if (cancelled) {
        ::kill(pid, SIGTERM);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (cancelled) {
        LOG_TRACE("Piper", "Synthesis cancelled");
        return;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        if (totalSamples == 0) {
            throw std::runtime_error(config_.executable + " exited with status " +
                                     std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1));
        }
        LOG_WARN("Piper", "piper exited abnormally after producing audio");
    }
}

} // namespace Parley
