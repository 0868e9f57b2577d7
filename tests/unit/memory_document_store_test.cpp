#include <iostream>

#include "internal/db/memory/memory_document_store.hpp"
#include "tests/unit/document_store_contract.hpp"

int main() {
  mediaflow::db::memory::MemoryDocumentStore store;
  mediaflow::testing::RunDocumentStoreContract(store);

  std::cout << "mediaflow_unit_memory_document_store: pass\n";
  return 0;
}
