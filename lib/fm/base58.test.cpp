/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/common/test.hpp>
#include <fm/base58.hpp>

using namespace ft_migrator;

suite base58_suite = [] {
    "base58"_test = [] {
        static std::vector<std::pair<std::string_view, std::string_view>> test_vectors {
            { "", "" },
            { "61", "2g" },
            { "626262", "a3gV" },
            { "636363", "aPEr" },
            { "0000287fb4cd", "11233QC4" },
            { "00eb15231dfceb60925886b67d065299925915aeb172c06647", "1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L" }
        };
        "encode"_test = [] {
            for (const auto &[hex, exp]: test_vectors)
                test_same(std::string { exp }, base58::encode(uint8_vector::from_hex(hex)));
        };
        "decode"_test = [] {
            for (const auto &[hex, in]: test_vectors)
                test_same(uint8_vector::from_hex(hex), base58::decode(in));
        };
        "invalid characters"_test = [] {
            expect(throws<error>([] { base58::decode("0OIl"); }));
        };
        "32-byte hash"_test = [] {
            const auto hash = uint8_vector::from_hex("E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855");
            const auto enc = base58::encode(hash);
            test_same(hash, base58::decode(enc));
        };
    };
};
