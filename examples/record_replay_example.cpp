#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <ctime>
#include <pcapstore/pcapstore.hpp>

using namespace pcapstore;

// Helper function to print timestamp details
void printTimestamp(const Timestamp& ts, const std::string& label) {
    std::time_t time = static_cast<std::time_t>(ts.seconds());
    std::tm* tm_info = std::gmtime(&time);
    std::cout << label << ": " << std::put_time(tm_info, "%Y-%m-%d %H:%M:%S");
    std::cout << "." << std::setfill('0') << std::setw(9) << ts.nanoseconds() << " UTC\n";
}

int main(int argc, char** argv) {
    std::cout << "PCAPSTORE Record/Replay Example\n";
    std::cout << "===============================\n\n";

    auto base_dir = argc > 1 ? std::filesystem::path(argv[1])
                             : std::filesystem::temp_directory_path() / "pcapstore_example";
    std::filesystem::create_directories(base_dir);

    set_log_level(spdlog::level::info);

    StoreConfig config = StoreConfig::low_memory();
    config.max_packets_per_segment = 25;
    config.index_interval = std::chrono::milliseconds{100};
    config.overwrite = true;

    // Example 1: Recording
    std::cout << "1. Recording\n";
    std::cout << "------------\n";

    const auto start = Timestamp::now();
    {
        auto writer = StoreWriter::create(base_dir, "demo", config);
        if (!writer) {
            std::cerr << "Failed to create store: " << writer.error().describe() << "\n";
            return 1;
        }

        for (uint32_t i = 0; i < 100; ++i) {
            std::vector<uint8_t> payload(64 + i, static_cast<uint8_t>(i));
            auto packet = DataPacket::create(start.offset_by(std::chrono::milliseconds{i * 20}),
                                             std::move(payload));
            if (!packet) {
                std::cerr << "Bad packet: " << packet.error().describe() << "\n";
                return 1;
            }
            if (auto r = writer->write_packet(*packet); !r) {
                std::cerr << "Write failed: " << r.error().describe() << "\n";
                return 1;
            }
        }

        if (auto r = writer->close(); !r) {
            std::cerr << "Close failed: " << r.error().describe() << "\n";
            return 1;
        }

        std::cout << "Packets written: " << writer->packet_count() << "\n";
        std::cout << "Segments:        " << writer->segment_count() << "\n";
        std::cout << "Bytes on disk:   " << writer->file_size() << "\n";
        std::cout << "Index file:      " << writer->index_path() << "\n\n";
    }

    // Example 2: Sequential replay
    std::cout << "2. Sequential Replay\n";
    std::cout << "--------------------\n";

    auto reader = StoreReader::open(base_dir, "demo", config);
    if (!reader) {
        std::cerr << "Failed to open store: " << reader.error().describe() << "\n";
        return 1;
    }

    if (auto first = reader->first_timestamp()) {
        printTimestamp(*first, "First packet");
    }
    if (auto last = reader->last_timestamp()) {
        printTimestamp(*last, "Last packet ");
    }

    size_t total_bytes = 0;
    size_t count = reader->for_each_packet([&](const PacketRecord& rec) {
        total_bytes += rec.packet.payload_length();
        return true;
    });
    std::cout << "Replayed " << count << " packets, " << total_bytes << " payload bytes\n\n";

    // Example 3: Seeking
    std::cout << "3. Seeking\n";
    std::cout << "----------\n";

    auto target = start.offset_by(std::chrono::milliseconds{1010});
    printTimestamp(target, "Seek target ");
    if (reader->seek_to_time(target)) {
        if (auto rec = reader->read_next_packet()) {
            printTimestamp(rec->packet.timestamp(), "Landed on   ");
            std::cout << "Sequence: " << rec->sequence << " in " << rec->segment.filename()
                      << "\n";
        }
    }

    if (reader->seek_to_packet(42)) {
        if (auto rec = reader->read_next_packet()) {
            std::cout << "Packet #42 payload size: " << rec->packet.payload_length() << "\n";
        }
    }

    return 0;
}
