#include "http/MultipartParser.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using chunkstitch::http::MultipartError;
using chunkstitch::http::MultipartParser;

const std::string kBoundary = "----chunkstitchBoundary";

std::string Field(const std::string& name, const std::string& value) {
  return "--" + kBoundary + "\r\n"
         "Content-Disposition: form-data; name=\"" + name + "\"\r\n"
         "\r\n" + value + "\r\n";
}

std::string FilePart(const std::string& name, const std::string& filename, const std::string& data) {
  return "--" + kBoundary + "\r\n"
         "Content-Disposition: form-data; name=\"" + name + "\"; filename=\"" + filename + "\"\r\n"
         "Content-Type: application/octet-stream\r\n"
         "\r\n" + data + "\r\n";
}

std::string Closing() {
  return "--" + kBoundary + "--\r\n";
}

void TestParsesFieldsAndFilePart() {
  const std::string binary("a\0b\r\nc", 6);
  const std::string body = Field("fileName", "test.txt") + Field("chunkIndex", "0") +
                           FilePart("chunk", "blob", binary) + Closing();

  const auto parts = MultipartParser::parse(body, kBoundary);
  assert(parts.size() == 3);

  assert(parts[0].name == "fileName");
  assert(!parts[0].isFile());
  assert(parts[0].dataAsString() == "test.txt");

  assert(parts[1].name == "chunkIndex");
  assert(parts[1].dataAsString() == "0");

  assert(parts[2].name == "chunk");
  assert(parts[2].isFile());
  assert(parts[2].filename == "blob");
  assert(parts[2].content_type == "application/octet-stream");
  assert(parts[2].dataAsString() == binary);
}

void TestPreambleAndEmptyValues() {
  const std::string body = "preamble text\r\n" + Field("additionalParams", "") + Closing();

  const auto parts = MultipartParser::parse(body, kBoundary);
  assert(parts.size() == 1);
  assert(parts[0].name == "additionalParams");
  assert(parts[0].data.empty());
}

void TestRejectsMalformedBodies() {
  bool threw = false;
  try {
    MultipartParser::parse("no boundary here", kBoundary);
  } catch (const MultipartError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    MultipartParser::parse("--" + kBoundary + "\r\nContent-Disposition: form-data; name=\"x\"\r\n", kBoundary);
  } catch (const MultipartError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    MultipartParser::parse(Field("a", "b"), "");
  } catch (const MultipartError&) {
    threw = true;
  }
  assert(threw);
}

void TestBoundaryAndMediaTypeExtraction() {
  assert(MultipartParser::extractBoundary("multipart/form-data; boundary=abc123") == "abc123");
  assert(MultipartParser::extractBoundary("multipart/form-data; charset=utf-8; BOUNDARY=\"q u\"") == "q u");
  assert(MultipartParser::extractBoundary("multipart/form-data").empty());

  assert(MultipartParser::extractMediaType("Multipart/Form-Data; boundary=x") == "multipart/form-data");
  assert(MultipartParser::extractMediaType(" application/json ") == "application/json");
}

} // namespace

int main() {
  TestParsesFieldsAndFilePart();
  TestPreambleAndEmptyValues();
  TestRejectsMalformedBodies();
  TestBoundaryAndMediaTypeExtraction();

  std::cout << "chunkstitch_unit_multipart_parser: pass\n";
  return 0;
}
