/**
 * @example 02_console_player.cc
 * @brief Interactive player driven by one-letter commands on stdin
 *
 * Every file on the command line is queued; with AUDIOPIPE_END_POLICY=advance
 * the player walks through them.
 */

#include "example_common.hh"
#include <audiopipe/transport.hh>
#include <audiopipe/codecs/register_codecs.hh>

#include <algorithm>
#include <atomic>
#include <deque>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace {
    const char* k_help =
        "commands:\n"
        "  p  play / pause / resume      s  stop\n"
        "  f  skip forward               b  skip back\n"
        "  +  volume up                  -  volume down\n"
        "  m  mute toggle                i  fade in / o  fade out\n"
        "  1  EQ flat  2  bass boost  3  treble boost\n"
        "  >  faster                     <  slower\n"
        "  v  levels                     t  status\n"
        "  q  quit\n";

    // Lines typed by the user, read on a separate thread
    class command_queue {
        public:
            std::atomic<bool> running{true};

            void push(std::string line) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_lines.push_back(std::move(line));
            }

            bool pop(std::string& line) {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_lines.empty()) {
                    return false;
                }
                line = std::move(m_lines.front());
                m_lines.pop_front();
                return true;
            }

        private:
            std::mutex m_mutex;
            std::deque<std::string> m_lines;
    };

    void print_status(const audiopipe::transport& player) {
        using audiopipe::examples::format_time;
        const auto stats = player.stats();
        const auto params = player.parameters();
        std::cout << to_string(player.state()) << ' ' << player.current_track().value_or("-") << ' '
                  << format_time(player.position_time());
        if (const auto total = player.duration_frames()) {
            std::cout << " / " << format_time(std::chrono::milliseconds(*total * 1000 / player.config().sample_rate));
        }
        std::cout << "  vol " << params->volume << (params->muted ? " (muted)" : "")
                  << "  speed " << params->speed
                  << "  ring " << stats.ring_frames << '/' << stats.ring_capacity
                  << "  underruns " << stats.underruns << '\n';
    }

    void print_levels(const audiopipe::transport& player) {
        const auto levels = player.levels();
        for (std::size_t ch = 0; ch < levels.size(); ch++) {
            const int bar = static_cast<int>(levels[ch].rms * 40.0f);
            std::cout << "ch" << ch << " " << std::string(static_cast<std::size_t>(std::min(bar, 40)), '#')
                      << std::string(static_cast<std::size_t>(40 - std::min(bar, 40)), '.')
                      << " peak " << levels[ch].peak << '\n';
        }
    }

    void execute(audiopipe::transport& player, char cmd, std::atomic<bool>& running) {
        using audiopipe::transport_state;
        const auto params = player.parameters();
        switch (cmd) {
            case 'p':
                if (player.state() == transport_state::playing) {
                    player.pause();
                } else if (player.state() == transport_state::paused) {
                    player.resume();
                } else {
                    player.play();
                }
                break;
            case 's': player.stop(); break;
            case 'f': player.skip(player.config().skip_step); break;
            case 'b': player.skip(-player.config().skip_step); break;
            case '+': player.set_volume(params->volume + 0.1f); break;
            case '-': player.set_volume(params->volume - 0.1f); break;
            case 'm': player.set_muted(!params->muted); break;
            case 'i': player.fade(audiopipe::fade_direction::in); break;
            case 'o': player.fade(audiopipe::fade_direction::out); break;
            case '1': player.set_equalizer_preset(audiopipe::eq_preset::flat); break;
            case '2': player.set_equalizer_preset(audiopipe::eq_preset::bass_boost); break;
            case '3': player.set_equalizer_preset(audiopipe::eq_preset::treble_boost); break;
            case '>': player.set_speed(params->speed * 1.25f); break;
            case '<': player.set_speed(params->speed / 1.25f); break;
            case 'v': print_levels(player); break;
            case 't': print_status(player); break;
            case 'q': running = false; break;
            default: std::cout << k_help; break;
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <audio_file> [more files...]\n";
        return 1;
    }

    try {
        auto config = audiopipe::config_from_environment();
        auto registry = audiopipe::create_registry_with_all_codecs();
        audiopipe::transport player(config, audiopipe::examples::create_default_backend());

        std::vector<std::string> queue(argv + 2, argv + argc);
        std::size_t next = 0;
        player.set_next_track_provider([&]() -> std::unique_ptr<audiopipe::track> {
            while (next < queue.size()) {
                try {
                    return audiopipe::examples::open_track(queue[next++], *registry);
                } catch (const audiopipe::audiopipe_error& e) {
                    std::cerr << "skipping: " << e.what() << '\n';
                }
            }
            return nullptr;
        });

        player.load(audiopipe::examples::open_track(argv[1], *registry));
        player.play();
        std::cout << k_help;

        // the reader may still be blocked in getline when main returns
        auto commands = std::make_shared<command_queue>();
        std::thread reader([commands] {
            std::string line;
            while (commands->running && std::getline(std::cin, line)) {
                commands->push(line);
            }
            commands->running = false;
        });
        reader.detach();

        while (commands->running) {
            std::string line;
            while (commands->pop(line)) {
                if (line.empty()) {
                    continue;
                }
                try {
                    execute(player, line[0], commands->running);
                } catch (const audiopipe::audiopipe_error& e) {
                    std::cout << e.what() << '\n';
                }
            }

            for (const auto& ev : player.process_events()) {
                switch (ev.type) {
                    case audiopipe::transport_event::kind::track_ended:
                        std::cout << "finished " << ev.message << '\n';
                        break;
                    case audiopipe::transport_event::kind::track_repeated:
                        std::cout << "repeating " << ev.message << '\n';
                        break;
                    case audiopipe::transport_event::kind::track_changed:
                        std::cout << "now playing " << ev.message << '\n';
                        break;
                    case audiopipe::transport_event::kind::stopped:
                        std::cout << "end of queue\n";
                        break;
                    case audiopipe::transport_event::kind::error:
                        std::cerr << "error: " << ev.message << '\n';
                        break;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        player.stop();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
