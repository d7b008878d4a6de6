#pragma once

#include <memory>
#include <string>
#include <rnp/rnp.h>

#include "key_errors.hpp"

namespace wkd {
namespace rnp {

// Owning wrappers for librnp handles; each releases its handle on scope exit.
template <typename T, rnp_result_t (*Destroy)(T*)>
struct HandleDeleter {
    void operator()(T* handle) const {
        if (handle) Destroy(handle);
    }
};

struct BufferDeleter {
    void operator()(char* buffer) const { rnp_buffer_destroy(buffer); }
};

using FfiPtr = std::unique_ptr<rnp_ffi_st, HandleDeleter<rnp_ffi_st, &rnp_ffi_destroy>>;
using InputPtr = std::unique_ptr<rnp_input_st, HandleDeleter<rnp_input_st, &rnp_input_destroy>>;
using OutputPtr = std::unique_ptr<rnp_output_st, HandleDeleter<rnp_output_st, &rnp_output_destroy>>;
using KeyPtr = std::unique_ptr<rnp_key_handle_st, HandleDeleter<rnp_key_handle_st, &rnp_key_handle_destroy>>;
using UidPtr = std::unique_ptr<rnp_uid_handle_st, HandleDeleter<rnp_uid_handle_st, &rnp_uid_handle_destroy>>;
using SignaturePtr = std::unique_ptr<rnp_signature_handle_st,
                                     HandleDeleter<rnp_signature_handle_st, &rnp_signature_handle_destroy>>;
using IteratorPtr = std::unique_ptr<rnp_identifier_iterator_st,
                                    HandleDeleter<rnp_identifier_iterator_st, &rnp_identifier_iterator_destroy>>;
using OpGeneratePtr = std::unique_ptr<rnp_op_generate_st, HandleDeleter<rnp_op_generate_st, &rnp_op_generate_destroy>>;
using BufferPtr = std::unique_ptr<char, BufferDeleter>;

// Throws E with the librnp description appended when rc is not RNP_SUCCESS.
template <typename E = KeyError>
inline void check(rnp_result_t rc, const std::string& what) {
    if (rc != RNP_SUCCESS) {
        throw E(what + ": " + rnp_result_to_string(rc));
    }
}

inline FfiPtr make_ffi() {
    rnp_ffi_t ffi = nullptr;
    check(rnp_ffi_create(&ffi, RNP_KEYSTORE_GPG, RNP_KEYSTORE_GPG), "Cannot create OpenPGP context");
    return FfiPtr(ffi);
}

}
}
