#include <audiopipe/sdk/decoders_registry.hh>
#include <audiopipe/sdk/decoder.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace audiopipe {

void decoders_registry::register_decoder(std::string name,
                                         accept_func_t accept,
                                         factory_func_t factory,
                                         int priority) {
    m_decoders.push_back({std::move(name), std::move(accept), std::move(factory), priority});

    std::stable_sort(m_decoders.begin(), m_decoders.end(),
                     [](const decoder_entry& a, const decoder_entry& b) {
                         return a.priority > b.priority;
                     });
}

const decoders_registry::decoder_entry* decoders_registry::probe(io_stream* stream) const {
    if (!stream) {
        return nullptr;
    }
    const auto original_pos = stream->tell();
    if (original_pos < 0) {
        return nullptr;
    }

    const decoder_entry* found = nullptr;
    for (const auto& entry : m_decoders) {
        stream->seek(original_pos, seek_origin::set);
        if (!entry.accept) {
            continue;
        }
        try {
            if (entry.accept(stream)) {
                found = &entry;
                break;
            }
        } catch (const std::exception& e) {
            LOG_DEBUG("decoders_registry", "probe", entry.name, "failed:", e.what());
        }
    }
    stream->seek(original_pos, seek_origin::set);
    return found;
}

std::unique_ptr<decoder> decoders_registry::find_decoder(io_stream* stream) const {
    const auto* entry = probe(stream);
    if (!entry || !entry->factory) {
        return nullptr;
    }
    LOG_DEBUG("decoders_registry", "selected codec", entry->name);
    return entry->factory();
}

bool decoders_registry::can_decode(io_stream* stream) const {
    return probe(stream) != nullptr;
}

size_t decoders_registry::size() const {
    return m_decoders.size();
}

void decoders_registry::clear() {
    m_decoders.clear();
}

} // namespace audiopipe
