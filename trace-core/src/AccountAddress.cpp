#include "AccountAddress.h"
#include "td/utils/misc.h"
#include "td/utils/logging.h"

std::string convert::to_raw_address(const block::StdAddress& address) {
  return std::to_string(address.workchain) + ":" + address.addr.to_hex();
}

td::Result<block::StdAddress> convert::to_std_address(td::Slice address) {
  address = td::trim(address);
  if (address.empty()) {
    return td::Status::Error("empty address");
  }
  block::StdAddress result;
  if (!result.parse_addr(address)) {
    return td::Status::Error(PSLICE() << "failed to parse address '" << address << "'");
  }
  return result;
}

td::Result<std::vector<block::StdAddress>> convert::to_std_address_list(td::Slice list) {
  std::vector<block::StdAddress> result;
  for (auto part : td::full_split(list, ',')) {
    if (td::trim(part).empty()) {
      continue;
    }
    TRY_RESULT(address, to_std_address(part));
    result.push_back(std::move(address));
  }
  return result;
}
