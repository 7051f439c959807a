#include <revscope/types/serialization.h>
#include <revscope/util/errors.h>

namespace revscope {
    CodecRegistry &CodecRegistry::instance() {
        static CodecRegistry registry;
        return registry;
    }

    void CodecRegistry::register_codec(SerializationCodec::ptr codec) {
        if (!codec) { throw_error<SerializationError>("Cannot register a null serialization codec"); }
        auto format{codec->format()};
        std::lock_guard guard{_lock};
        _codecs.insert_or_assign(std::move(format), std::move(codec));
    }

    void CodecRegistry::unregister_codec(const std::string &format) {
        std::lock_guard guard{_lock};
        _codecs.erase(format);
    }

    bool CodecRegistry::has_codec(const std::string &format) const {
        std::lock_guard guard{_lock};
        return _codecs.contains(format);
    }

    SerializationCodec::ptr CodecRegistry::get_codec(const std::string &format) const {
        std::lock_guard guard{_lock};
        auto it{_codecs.find(format)};
        if (it == _codecs.end()) {
            throw_error<SerializationError>("No serialization codec is registered for the format '{}'", format);
        }
        return it->second;
    }
} // namespace revscope
