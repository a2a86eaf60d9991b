//
// Float to device format conversion used by the device sink callback.
//

#ifndef AUDIOPIPE_FROM_FLOAT_CONVERTER_HH
#define AUDIOPIPE_FROM_FLOAT_CONVERTER_HH

#include <audiopipe/sdk/audio_format.hh>
#include <audiopipe/sdk/types.hh>
#include <audiopipe/sdk/export_audiopipe_sdk.h>

namespace audiopipe {
    /**
     * Converts @p src_samples floats into @p dst. Exactly @p dst_bytes are
     * written: samples that do not fit are dropped and the tail not covered
     * by @p src is filled with the format's silence value. Converters never
     * allocate and may be called from the device callback.
     */
    using from_float_converter_func_t = void(*)(uint8_t* dst, size_t dst_bytes,
                                                const float* src, size_t src_samples) noexcept;

    /**
     * @return converter for @p fmt, or nullptr when the format is unknown
     */
    AUDIOPIPE_SDK_EXPORT from_float_converter_func_t get_from_float_converter(audio_format fmt);
}

#endif
