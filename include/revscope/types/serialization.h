#ifndef REVSCOPE_TYPES_SERIALIZATION_H
#define REVSCOPE_TYPES_SERIALIZATION_H

#include <revscope/revscope_base.h>

#include <ankerl/unordered_dense.h>

#include <mutex>

namespace revscope {
    /**
     * Turns an entity into the opaque payload stored with a version. The format name is what adapters refer to.
     */
    struct REVSCOPE_EXPORT SerializationCodec {
        using ptr = std::shared_ptr<const SerializationCodec>;

        virtual ~SerializationCodec() = default;

        [[nodiscard]] virtual std::string format() const = 0;

        [[nodiscard]] virtual std::string serialize(const Entity &entity,
                                                    const std::vector<std::string> &field_names) const = 0;
    };

    /**
     * Process wide table of codecs by format name.
     */
    struct REVSCOPE_EXPORT CodecRegistry {
        static CodecRegistry &instance();

        // Registers (or replaces) the codec for its format.
        void register_codec(SerializationCodec::ptr codec);

        void unregister_codec(const std::string &format);

        [[nodiscard]] bool has_codec(const std::string &format) const;

        [[nodiscard]] SerializationCodec::ptr get_codec(const std::string &format) const;

    private:
        mutable std::mutex _lock;
        ankerl::unordered_dense::map<std::string, SerializationCodec::ptr> _codecs;
    };
} // namespace revscope

#endif  // REVSCOPE_TYPES_SERIALIZATION_H
