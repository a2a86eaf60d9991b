/**
 * @example 01_play_file.cc
 * @brief Basic example: Playing an audio file
 *
 * Loads a file, plays it to the end with a fade-in and exits.
 */

#include "example_common.hh"
#include <audiopipe/transport.hh>
#include <audiopipe/codecs/register_codecs.hh>
#include <iostream>
#include <thread>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <audio_file>\n";
        std::cerr << "Supported formats: WAV, FLAC, MP3\n";
        return 1;
    }

    try {
        auto config = audiopipe::config_from_environment();
        auto registry = audiopipe::create_registry_with_all_codecs();

        audiopipe::transport player(config, audiopipe::examples::create_default_backend());
        player.load(audiopipe::examples::open_track(argv[1], *registry));

        const auto total = player.duration_frames();
        std::cout << "Loaded " << argv[1];
        if (total) {
            std::cout << " (" << audiopipe::examples::format_time(
                std::chrono::milliseconds(*total * 1000 / config.sample_rate)) << ")";
        }
        std::cout << '\n';

        player.play(true);
        std::cout << "Playing... Press Ctrl+C to stop\n";

        bool done = false;
        while (!done) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            for (const auto& ev : player.process_events()) {
                if (ev.type == audiopipe::transport_event::kind::error) {
                    std::cerr << "Playback failed: " << ev.message << '\n';
                    return 1;
                }
                if (ev.type == audiopipe::transport_event::kind::track_ended) {
                    done = true;
                }
            }
        }

        std::cout << "Playback finished\n";

    } catch (const audiopipe::device_error& e) {
        std::cerr << "Device error: " << e.what() << '\n';
        return 1;
    } catch (const audiopipe::decoder_error& e) {
        std::cerr << "Decoder error: " << e.what() << '\n';
        std::cerr << "File format might not be supported\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
