#include "bridge.hpp"

#include <cassert>
#include <stdexcept>
#include <string>
#include <system_error>

#include <asyncssl/read_buf.hpp>

namespace asyncssl {

// BIO_METHOD forwarding to StreamBridge.
//
// Exceptions never cross into OpenSSL: a would-block becomes a retry flag,
// any failure is recorded on the bridge and picked up by whoever inspects
// the failed SSL_* call.
struct BridgeBioMethod {
    BIO_METHOD *method;

    BridgeBioMethod()
    {
        method = BIO_meth_new(BIO_get_new_index() | BIO_TYPE_SOURCE_SINK, "asyncssl bridge");
        if (method == nullptr) {
            return;
        }
        BIO_meth_set_write(method, bwrite);
        BIO_meth_set_read(method, bread);
        BIO_meth_set_puts(method, bputs);
        BIO_meth_set_ctrl(method, ctrl);
        BIO_meth_set_create(method, create);
        BIO_meth_set_destroy(method, destroy);
    }

    ~BridgeBioMethod()
    {
        BIO_meth_free(method);
    }

    static auto bridgeOf(BIO *bio) -> StreamBridge&
    {
        auto *bridge = static_cast<StreamBridge *>(BIO_get_data(bio));
        assert(bridge != nullptr);
        return *bridge;
    }

    template <typename F>
    static int guard(BIO *bio, int retryFlag, F&& f)
    {
        auto& bridge = bridgeOf(bio);
        BIO_clear_retry_flags(bio);
        try {
            return f(bridge);
        }
        catch (IoError const& e) {
            if (e.isWouldBlock()) {
                BIO_set_flags(bio, BIO_FLAGS_SHOULD_RETRY | retryFlag);
            }
            bridge.error_ = e;
        }
        catch (std::exception const& e) {
            bridge.error_ = IoError{std::make_error_code(std::errc::io_error), e.what()};
        }
        return -1;
    }

    static int bwrite(BIO *bio, char const *data, int size)
    {
        return guard(bio, BIO_FLAGS_WRITE, [&](StreamBridge& bridge) {
            return static_cast<int>(bridge.write(reinterpret_cast<uint8_t const *>(data), size));
        });
    }

    static int bread(BIO *bio, char *data, int size)
    {
        return guard(bio, BIO_FLAGS_READ, [&](StreamBridge& bridge) {
            return static_cast<int>(bridge.read(reinterpret_cast<uint8_t *>(data), size));
        });
    }

    static int bputs(BIO *bio, char const *text)
    {
        return bwrite(bio, text, static_cast<int>(std::char_traits<char>::length(text)));
    }

    static long ctrl(BIO *bio, int cmd, long, void *)
    {
        if (cmd != BIO_CTRL_FLUSH) {
            return 0;
        }
        int const result = guard(bio, BIO_FLAGS_WRITE, [](StreamBridge& bridge) {
            bridge.flush();
            return 1;
        });
        return result == 1 ? 1 : 0;
    }

    static int create(BIO *bio)
    {
        BIO_set_init(bio, 1);
        BIO_set_data(bio, nullptr);
        BIO_set_flags(bio, 0);
        return 1;
    }

    static int destroy(BIO *bio)
    {
        if (bio == nullptr) {
            return 0;
        }
        BIO_set_data(bio, nullptr);
        BIO_set_init(bio, 0);
        return 1;
    }

    static auto instance() -> BIO_METHOD const *
    {
        static BridgeBioMethod const bridgeMethod;
        return bridgeMethod.method;
    }
};

StreamBridge::StreamBridge(AsyncStreamPtr stream)
    : stream_{std::move(stream)}, context_{nullptr}
{
    assert(stream_);
}

auto StreamBridge::context() -> Context&
{
    if (context_ == nullptr) {
        throw std::logic_error{"stream used outside of a poll call, no task context installed"};
    }
    return *context_;
}

auto StreamBridge::read(uint8_t *data, size_t size) -> size_t
{
    auto& cx = this->context();
    ReadBuf buf{data, size};
    if (stream_->pollRead(cx, buf).isPending()) {
        throw IoError::wouldBlock();
    }
    return buf.filledSize();
}

auto StreamBridge::write(uint8_t const *data, size_t size) -> size_t
{
    auto& cx = this->context();
    auto result = stream_->pollWrite(cx, data, size);
    if (result.isPending()) {
        throw IoError::wouldBlock();
    }
    return result.value();
}

void StreamBridge::flush()
{
    auto& cx = this->context();
    if (stream_->pollFlush(cx).isPending()) {
        throw IoError::wouldBlock();
    }
}

auto StreamBridge::writeVectored(IoSlice const *slices, size_t count) -> size_t
{
    auto& cx = this->context();
    auto result = stream_->pollWriteVectored(cx, slices, count);
    if (result.isPending()) {
        throw IoError::wouldBlock();
    }
    return result.value();
}

auto StreamBridge::takeError() -> std::optional<IoError>
{
    auto error = std::move(error_);
    error_.reset();
    return error;
}

auto StreamBridge::createBio() -> BIO *
{
    auto const *method = BridgeBioMethod::instance();
    if (method == nullptr) {
        throw AsyncSslException{"error BIO_meth_new"};
    }

    BIO *bio = BIO_new(method);
    if (bio == nullptr) {
        throw AsyncSslException{"error BIO_new"};
    }
    BIO_set_data(bio, this);
    return bio;
}

ContextScope::ContextScope(StreamBridge& bridge, Context& cx)
    : bridge_{bridge}
{
    if (bridge_.context_ != nullptr) {
        throw std::logic_error{"a task context is already installed on this stream"};
    }
    bridge_.context_ = &cx;
    bridge_.error_.reset();
}

ContextScope::~ContextScope()
{
    bridge_.context_ = nullptr;
}

}  // namespace asyncssl
