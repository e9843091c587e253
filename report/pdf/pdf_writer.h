#pragma once

#include <string>
#include <vector>

struct PdfObject {
  std::string body;
};

// Serializes numbered objects (object N is objects[N-1]) with the header,
// cross-reference table and trailer. infoObjectIndex may be 0 when the
// document carries no information dictionary.
bool SerializePdfDocument(const std::vector<PdfObject> &objects,
                          size_t catalogObjectIndex, size_t infoObjectIndex,
                          std::string &out, std::string &error);
