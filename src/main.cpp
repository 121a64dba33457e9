#include "AudioRecorder/CaptureEngine.hpp"
#include "AudioRecorder/RtAudioDevice.hpp"
#include "SavingWorkers/RenderSaver.hpp"
#include "SavingWorkers/WavEncoder.hpp"
#include "Storage/FileStore.hpp"
#include "Storage/Journal.hpp"
#include "common/AppConfig.hpp"
#include "common/debug_log.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

class WasmixApplication {
public:
    explicit WasmixApplication(AppConfig config)
        : _config(std::move(config))
        , _running(true) {
    }

    ~WasmixApplication() {
        StopPumping();
    }

    bool Run() {
        _store = std::make_shared<FileStore>(_config.storeRoot);
        _journal = std::make_shared<Journal>(_store);
        _saver = std::make_unique<RenderSaver>(_store, _journal, _config.documentId, _config.snapshotInterval);

        CaptureConfig captureConfig;
        captureConfig.preferredSampleRates = _config.preferredSampleRates;
        captureConfig.framesPerBlock = _config.framesPerBlock;
        captureConfig.ringCapacityBlocks = _config.ringCapacityBlocks;
        _engine = std::make_unique<CaptureEngine>(std::make_shared<RtAudioDevice>(), captureConfig);

        // Recover before any capture starts.
        PrintState(_journal->Replay(_config.documentId));
        PrintHelp();

        std::string command;
        while (_running && std::cout << "> " << std::flush && std::cin >> command) {
            try {
                if (!ProcessCommand(command)) {
                    break;
                }
            } catch (const std::exception& e) {
                std::cerr << "[ERROR] " << command << ": " << e.what() << std::endl;
            }
        }

        StopPumping();
        if (_engine->State() == CaptureState::Monitoring || _engine->State() == CaptureState::Recording) {
            _engine->Stop();
        }
        _saver->Flush();
        return true;
    }

private:
    bool ProcessCommand(const std::string& command) {
        if (command == "start") {
            _engine->Start();
            DeviceDescription device = _engine->Device();
            std::cout << "Audio active: " << device.name << ", " << device.sampleRate << " Hz, "
                      << device.framesPerBlock << " frames/block" << std::endl;
            StartPumping();
        }
        else if (command == "record") {
            _engine->Record();
            std::cout << "Recording started..." << std::endl;
        }
        else if (command == "stop") {
            StopPumping();
            _engine->Stop();
            std::cout << "Stopped, " << _engine->RecordedSampleCount() << " samples in take, "
                      << _engine->OverrunCount() << " overrun(s)" << std::endl;
        }
        else if (command == "level") {
            std::cout << "RMS level: " << std::fixed << std::setprecision(4) << _engine->Level() << std::endl;
        }
        else if (command == "export") {
            Export();
        }
        else if (command == "save") {
            Save();
        }
        else if (command == "list") {
            List();
        }
        else if (command == "load") {
            Load();
        }
        else if (command == "replay") {
            PrintState(_journal->Replay(_config.documentId));
        }
        else if (command == "snapshot") {
            JournalEntry entry = _journal->Snapshot(_config.documentId, _journal->Replay(_config.documentId));
            std::cout << "Snapshot recorded as entry #" << entry.seq << std::endl;
        }
        else if (command == "quit" || command == "exit") {
            _running = false;
            return false;
        }
        else if (command == "help") {
            PrintHelp();
        }
        else {
            std::cout << "Unknown command: " << command << std::endl;
            PrintHelp();
        }
        return true;
    }

    void Export() {
        std::optional<RenderArtifact> wav = _engine->Export();
        if (!wav) {
            std::cout << "Nothing to export" << std::endl;
            return;
        }

        std::ofstream out(_config.exportPath, std::ios::binary);
        out.write(reinterpret_cast<const char*>(wav->bytes.data()), static_cast<std::streamsize>(wav->Size()));
        out.close();
        if (!out) {
            std::cerr << "Could not write " << _config.exportPath << std::endl;
            return;
        }
        std::cout << "Exported " << wav->sampleCount << " samples (" << RenderArtifact::kMimeType << ", "
                  << wav->Size() << " bytes) to " << _config.exportPath << std::endl;
    }

    void Save() {
        std::optional<RenderArtifact> wav = _engine->LatestArtifact();
        if (!wav) {
            std::cout << "Export WAV first" << std::endl;
            return;
        }
        _saver->Save(_config.renderPath, *wav);
        std::cout << "Saved to store: " << _config.renderPath << std::endl;
        List();
    }

    void List() {
        std::vector<std::string> files = _store->List("renders");
        if (files.empty()) {
            std::cout << "No files yet. Record something first!" << std::endl;
        }
        for (const std::string& file : files) {
            std::cout << "  " << file << std::endl;
        }
    }

    void Load() {
        std::optional<std::vector<uint8_t>> bytes = _store->LoadLatest("renders");
        if (!bytes) {
            std::cout << "No file" << std::endl;
            return;
        }
        WavInfo info = ReadWavInfo(*bytes);
        std::cout << "Latest render: " << bytes->size() << " bytes, " << info.frames << " frames, "
                  << info.sampleRate << " Hz, " << info.numChannels << " channel(s), "
                  << info.bitsPerSample << " bit" << std::endl;
    }

    void PrintState(const JournalState& state) {
        std::cout << "[JOURNAL] " << _config.documentId << ": last seq " << state.lastSeq
                  << ", " << state.renderSaves << " render save(s), "
                  << state.discardedEntries << " discarded entr" << (state.discardedEntries == 1 ? "y" : "ies")
                  << std::endl;
        for (const auto& [path, bytes] : state.renders) {
            std::cout << "  " << path << " (" << bytes << " bytes)" << std::endl;
        }
    }

    // Consumer side of the ring buffer while the stream is open.
    void StartPumping() {
        StopPumping();
        _pumping = true;
        _pumpThread = std::make_unique<std::thread>([this]() {
            while (_pumping) {
                _engine->Pump();
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        });
    }

    void StopPumping() {
        _pumping = false;
        if (_pumpThread && _pumpThread->joinable()) {
            _pumpThread->join();
        }
        _pumpThread.reset();
    }

    void PrintHelp() {
        std::cout << "\n=== wasmix ===" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  start     - Open the input device and start monitoring" << std::endl;
        std::cout << "  record    - Start a new take" << std::endl;
        std::cout << "  stop      - Stop capture" << std::endl;
        std::cout << "  level     - Show the monitor level" << std::endl;
        std::cout << "  export    - Encode the take to " << _config.exportPath << std::endl;
        std::cout << "  save      - Store the last export as " << _config.renderPath << std::endl;
        std::cout << "  list      - List stored renders" << std::endl;
        std::cout << "  load      - Inspect the latest stored render" << std::endl;
        std::cout << "  replay    - Replay the journal" << std::endl;
        std::cout << "  snapshot  - Record a journal snapshot" << std::endl;
        std::cout << "  help      - Show this help" << std::endl;
        std::cout << "  quit      - Exit application" << std::endl;
        std::cout << "===============\n" << std::endl;
    }

    AppConfig _config;
    std::shared_ptr<FileStore> _store;
    std::shared_ptr<Journal> _journal;
    std::unique_ptr<RenderSaver> _saver;
    std::unique_ptr<CaptureEngine> _engine;
    std::unique_ptr<std::thread> _pumpThread;
    std::atomic<bool> _pumping{false};
    std::atomic<bool> _running;
};

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = ParseCommandLine(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        std::cout << "Usage: " << argv[0] << " [--config <file.json>] [--store <dir>] [--doc <id>]" << std::endl;
        return 1;
    }

    try {
        WasmixApplication app(config);
        return app.Run() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
