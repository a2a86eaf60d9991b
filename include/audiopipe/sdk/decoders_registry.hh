/**
 * @file decoders_registry.hh
 * @brief Codec selection by content probing
 * @ingroup decoder_interface
 */

#pragma once

#include <audiopipe/sdk/export_audiopipe_sdk.h>
#include <audiopipe/sdk/io_stream.hh>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace audiopipe {

    class decoder;

    /**
     * @class decoders_registry
     * @brief Ordered list of codecs tried when a track is opened
     * @ingroup decoder_interface
     *
     * Each entry has a probe (accept function) and a factory. find_decoder()
     * tries the probes in priority order (higher first, registration order
     * for equal priority) and instantiates the first codec that accepts the
     * stream. The stream position is restored after every probe.
     *
     * @code
     * decoders_registry registry;
     * registry.register_decoder("wav", decoder_drwav::accept,
     *                           [] { return std::make_unique<decoder_drwav>(); }, 100);
     * auto dec = registry.find_decoder(io.get());
     * @endcode
     */
    class AUDIOPIPE_SDK_EXPORT decoders_registry {
    public:
        using accept_func_t = std::function<bool(io_stream*)>;
        using factory_func_t = std::function<std::unique_ptr<decoder>()>;

        /**
         * @brief Add a codec
         * @param name Short codec name used in log messages
         * @param accept Probe; must not take ownership of the stream
         * @param factory Creates an unopened decoder
         * @param priority Higher values are probed first
         */
        void register_decoder(std::string name,
                              accept_func_t accept,
                              factory_func_t factory,
                              int priority = 0);

        /**
         * @brief Instantiate the first codec whose probe accepts @p stream
         * @return Unopened decoder, or nullptr if no codec matches
         */
        [[nodiscard]] std::unique_ptr<decoder> find_decoder(io_stream* stream) const;

        [[nodiscard]] bool can_decode(io_stream* stream) const;

        [[nodiscard]] size_t size() const;

        void clear();

    private:
        struct decoder_entry {
            std::string name;
            accept_func_t accept;
            factory_func_t factory;
            int priority;
        };

        [[nodiscard]] const decoder_entry* probe(io_stream* stream) const;

        std::vector<decoder_entry> m_decoders;
    };

} // namespace audiopipe
