#include <audiopipe/codecs/register_codecs.hh>
#include <audiopipe/sdk/decoders_registry.hh>

#include <audiopipe/codecs/decoder_drwav.hh>
#include <audiopipe/codecs/decoder_drflac.hh>
#include <audiopipe/codecs/decoder_drmp3.hh>

namespace audiopipe {

void register_all_codecs(decoders_registry& registry) {
    // WAV - RIFF header, cheap to verify
    registry.register_decoder(
        "wav",
        decoder_drwav::accept,
        []() { return std::make_unique<decoder_drwav>(); },
        100
    );

    // FLAC - "fLaC" marker
    registry.register_decoder(
        "flac",
        decoder_drflac::accept,
        []() { return std::make_unique<decoder_drflac>(); },
        90
    );

    // MP3 - frame sync search, accepts the most
    registry.register_decoder(
        "mp3",
        decoder_drmp3::accept,
        []() { return std::make_unique<decoder_drmp3>(); },
        80
    );
}

std::shared_ptr<decoders_registry> create_registry_with_all_codecs() {
    auto registry = std::make_shared<decoders_registry>();
    register_all_codecs(*registry);
    return registry;
}

} // namespace audiopipe
