//
// Created by igor on 12/08/2025.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>

#include <munge/exceptions.hh>
#include <munge/chunk_header.hh>

namespace munge {
    // Base reader interface
    class reader_base {
        public:
            enum whence_t {
                set,
                cur,
                end
            };

        public:
            virtual ~reader_base() = default;

            // Simple interface - throws on error
            virtual std::size_t read(void* dst, std::size_t size) = 0;
            virtual void seek(std::uint64_t offset, whence_t whence) = 0;
            virtual std::uint64_t tell() const = 0;
            virtual std::uint64_t size() const = 0;

            // Header at the current position; leaves the reader at the payload
            chunk_header read_header();
    };

    // Reads from an istream without limits
    class reader : public reader_base {
        public:
            explicit reader(std::istream& is);
            ~reader() override = default;

            std::size_t read(void* dst, std::size_t size) override;
            void seek(std::uint64_t offset, whence_t whence) override;
            std::uint64_t tell() const override;
            std::uint64_t size() const override;

        private:
            std::istream& m_stream;
    };
}
