#ifndef AUDIOPIPE_CODECS_REGISTER_CODECS_HH
#define AUDIOPIPE_CODECS_REGISTER_CODECS_HH

#include <audiopipe/codecs/export_audiopipe_codecs.h>
#include <memory>

namespace audiopipe {
    class decoders_registry;

    /**
     * @brief Register the WAV, FLAC and MP3 decoders with @p registry
     *
     * Codecs with a reliable signature are probed first; MP3 frame sync
     * detection is the weakest probe and comes last.
     */
    AUDIOPIPE_CODECS_EXPORT void register_all_codecs(decoders_registry& registry);

    /**
     * @brief Create a registry with every bundled codec registered
     */
    AUDIOPIPE_CODECS_EXPORT std::shared_ptr<decoders_registry> create_registry_with_all_codecs();
}

#endif // AUDIOPIPE_CODECS_REGISTER_CODECS_HH
