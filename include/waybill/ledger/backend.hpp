#pragma once

#include <waybill/schema/encoding/scale/encoder.hpp>
#include <waybill/storage/rocksdb/storage.hpp>

namespace waybill::ledger {

using encoder_t = waybill::schema::encoding::encoder<
    waybill::schema::encoding::scale_encoder_tag>;
using storage_t =
    waybill::storage::storage<waybill::storage::rocksdb_storage_tag>;

}  // namespace waybill::ledger
