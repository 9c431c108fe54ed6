#pragma once

#include <rapidcheck.h>
#include "core/model.hpp"

#include <string>
#include <vector>

namespace listall::test {

// Words that keep names and titles readable while covering non-ASCII text.
inline const std::vector<std::string> kWords = {
    "milk", "Bread", "eggs", "ÄPFEL", "straße", "café", "牛乳", "хлеб", "🍞", "x", "2024"
};

// One to four words joined by single spaces: never blank, never padded.
inline rc::Gen<std::string> gen_name() {
    return rc::gen::exec([] {
        const auto count = *rc::gen::inRange<size_t>(1, 5);
        const auto words = *rc::gen::container<std::vector<std::string>>(count, rc::gen::elementOf(kWords));
        std::string out;
        for (const auto& w : words) {
            if (!out.empty()) out += ' ';
            out += w;
        }
        return out;
    });
}

// Up to year 9999, so the text form keeps four year digits.
inline rc::Gen<Timestamp> gen_timestamp() {
    return rc::gen::map(rc::gen::inRange<int64_t>(0, 253402300800000),
                        [](int64_t millis) { return Timestamp(millis); });
}

} // namespace listall::test

namespace rc {

template<>
struct Arbitrary<listall::Uuid> {
    static Gen<listall::Uuid> arbitrary() {
        return gen::map(gen::arbitrary<listall::Uuid::Bytes>(),
                        [](const listall::Uuid::Bytes& bytes) { return listall::Uuid(bytes); });
    }
};

template<>
struct Arbitrary<listall::ItemImage> {
    static Gen<listall::ItemImage> arbitrary() {
        return gen::exec([] {
            listall::ItemImage image;
            image.id = *gen::arbitrary<listall::Uuid>();
            image.image_data = *gen::container<std::vector<uint8_t>>(gen::arbitrary<uint8_t>());
            image.order_number = *gen::inRange(0, 100);
            image.created_at = *listall::test::gen_timestamp();
            return image;
        });
    }
};

template<>
struct Arbitrary<listall::List> {
    static Gen<listall::List> arbitrary() {
        return gen::exec([] {
            listall::List list;
            list.id = *gen::arbitrary<listall::Uuid>();
            list.name = *listall::test::gen_name();
            list.order_number = *gen::inRange(0, 100);
            list.is_archived = *gen::arbitrary<bool>();
            list.created_at = *listall::test::gen_timestamp();
            list.modified_at = *listall::test::gen_timestamp();

            const auto item_count = *gen::inRange(0, 6);
            for (int i = 0; i < item_count; ++i) {
                listall::Item item;
                item.id = *gen::arbitrary<listall::Uuid>();
                item.list_id = list.id;
                item.title = *listall::test::gen_name();
                if (*gen::arbitrary<bool>()) {
                    item.description = *listall::test::gen_name();
                }
                item.quantity = *gen::inRange(1, 1000);
                item.order_number = i;
                item.is_crossed_out = *gen::arbitrary<bool>();
                item.created_at = *listall::test::gen_timestamp();
                item.modified_at = *listall::test::gen_timestamp();
                item.images = *gen::container<std::vector<listall::ItemImage>>(
                    *gen::inRange<size_t>(0, 3), gen::arbitrary<listall::ItemImage>());
                list.items.push_back(std::move(item));
            }
            return list;
        });
    }
};

template<>
struct Arbitrary<listall::ExportData> {
    static Gen<listall::ExportData> arbitrary() {
        return gen::exec([] {
            listall::ExportData data;
            data.export_date = *listall::test::gen_timestamp();
            data.lists = *gen::container<std::vector<listall::List>>(
                *gen::inRange<size_t>(0, 5), gen::arbitrary<listall::List>());
            return data;
        });
    }
};

} // namespace rc
