#include <cassert>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "crypto.h"
#include "encoding_utils.h"
#include "payload_codec.h"
#include "server_keys.h"
#include "transmission_key.h"

using nlohmann::json;
using namespace ksm::core;
namespace common = ksm::common;

namespace {

struct Fixture {
  crypto::EcKeyPair server;
  crypto::EcKeyPair device;
  ServerKeyTable table;

  Fixture() {
    Error error;
    assert(crypto::GenerateEcKeyPair(server, error));
    assert(crypto::GenerateEcKeyPair(device, error));
    ServerKeyTable::KeyMap keys;
    keys.emplace(7, server.public_key);
    keys.emplace(8, server.public_key);
    table = ServerKeyTable(1, std::move(keys));
  }
};

HttpResponse JsonResponse(int status, const json& doc) {
  HttpResponse response;
  response.status = status;
  response.body = common::StringToBytes(doc.dump());
  return response;
}

void TestPayloadJson() {
  GetPayload get;
  get.client_id = "abc";
  json doc = json::parse(ToJson(get));
  assert(doc["clientVersion"] == kClientVersion);
  assert(doc["clientId"] == "abc");
  assert(!doc.contains("publicKey"));
  assert(!doc.contains("requestedRecords"));
  assert(!doc.contains("requestedFolders"));

  get.public_key = "BPUB";
  get.requested_records = {"r1", "r2"};
  doc = json::parse(ToJson(get));
  assert(doc["publicKey"] == "BPUB");
  assert(doc["requestedRecords"].size() == 2);

  UpdatePayload update;
  update.client_id = "abc";
  update.record_uid = "uid1";
  update.revision = 42;
  update.data = "ZGF0YQ";
  doc = json::parse(ToJson(update));
  assert(doc["revision"] == 42);
  assert(!doc.contains("transactionType"));
  update.transaction_type = TransactionType::kRotation;
  doc = json::parse(ToJson(update));
  assert(doc["transactionType"] == "rotation");

  CreatePayload create;
  create.record_uid = "new";
  create.folder_uid = "sf";
  doc = json::parse(ToJson(create));
  assert(doc["folderUid"] == "sf");
  assert(!doc.contains("subFolderUid"));
  create.sub_folder_uid = "nested";
  doc = json::parse(ToJson(create));
  assert(doc["subFolderUid"] == "nested");

  DeletePayload del;
  del.record_uids = {"a", "b"};
  doc = json::parse(ToJson(del));
  assert(doc["recordUids"].size() == 2);

  DeleteFolderPayload del_folders;
  del_folders.folder_uids = {"f1"};
  doc = json::parse(ToJson(del_folders));
  assert(doc["folderUids"] == json::array({"f1"}));
  assert(doc["forceDeletion"] == false);

  UpdateFolderPayload rename;
  rename.folder_uid = "f1";
  rename.data = "bmFtZQ";
  doc = json::parse(ToJson(rename));
  assert(doc["folderUid"] == "f1");
  assert(doc["data"] == "bmFtZQ");

  FileUploadPayload file;
  file.file_record_uid = "file1";
  file.owner_record_uid = "rec1";
  file.link_key = "bGluaw";
  file.file_size = 4096;
  doc = json::parse(ToJson(file));
  assert(doc["fileRecordUid"] == "file1");
  assert(doc["ownerRecordUid"] == "rec1");
  assert(doc["linkKey"] == "bGluaw");
  assert(doc["fileSize"] == 4096);
  assert(doc.contains("fileRecordKey") && doc.contains("ownerRecordData"));

  assert(EndpointUrl("h", Endpoint::kAddFile) ==
         "https://h/api/rest/sm/v1/add_file");
  assert(std::string(EndpointName(Endpoint::kDeleteFolder)) ==
         "delete_folder");
}

void TestSignedRequest(const Fixture& fx) {
  TransmissionKey key;
  Error error;
  assert(NewTransmissionKey(fx.table, 8u, key, error));

  HttpRequest request;
  const std::string payload = R"({"clientId":"abc"})";
  assert(BuildSignedRequest("keepersecurity.eu", Endpoint::kGetSecret,
                            payload, key, fx.device.private_der, request,
                            error));
  assert(request.url ==
         "https://keepersecurity.eu/api/rest/sm/v1/get_secret");
  assert(EndpointUrl("h", Endpoint::kFinalizeSecretUpdate) ==
         "https://h/api/rest/sm/v1/finalize_secret_update");

  const std::string* id = request.FindHeader("publickeyid");
  assert(id && *id == "8");
  const std::string* content_type = request.FindHeader("Content-Type");
  assert(content_type && *content_type == "application/octet-stream");
  const std::string* tk = request.FindHeader("TransmissionKey");
  assert(tk && *tk == common::Base64Encode(key.encrypted_key));

  const std::string* auth = request.FindHeader("Authorization");
  assert(auth && auth->rfind("Signature ", 0) == 0);
  std::vector<std::uint8_t> signature;
  assert(common::Base64Decode(auth->substr(10), signature));
  std::vector<std::uint8_t> signed_bytes = key.encrypted_key;
  signed_bytes.insert(signed_bytes.end(), request.body.begin(),
                      request.body.end());
  assert(crypto::EcdsaVerify(fx.device.public_key, signed_bytes, signature,
                             error));

  std::vector<std::uint8_t> plain;
  assert(DecryptPayload(request.body, key, plain, error));
  assert(common::BytesToString(plain) == payload);

  HttpRequest rejected;
  assert(!BuildSignedRequest("", Endpoint::kGetSecret, payload, key,
                             fx.device.private_der, rejected, error));
  assert(error.code == ErrorCode::kInvalidArgument);
}

void TestDecryptResponse(const Fixture& fx) {
  TransmissionKey key;
  Error error;
  assert(NewTransmissionKey(fx.table, std::nullopt, key, error));

  HttpResponse response;
  response.status = 200;
  assert(EncryptPayload(common::StringToBytes("{}"), key, response.body,
                        error));
  std::vector<std::uint8_t> plain;
  assert(DecryptResponse(response, key, plain, error));
  assert(common::BytesToString(plain) == "{}");

  HttpResponse empty;
  empty.status = 200;
  assert(DecryptResponse(empty, key, plain, error));
  assert(plain.empty());

  TransmissionKey other;
  assert(NewTransmissionKey(fx.table, std::nullopt, other, error));
  assert(!DecryptResponse(response, other, plain, error));
  assert(error.code == ErrorCode::kAuthenticationFailed);

  error.Clear();
  response.status = 500;
  assert(!DecryptResponse(response, key, plain, error));
  assert(error.code == ErrorCode::kServer);
}

void TestClassify(const Fixture& fx) {
  ServerError se = ClassifyServerError(
      JsonResponse(400, {{"error", "key"}, {"key_id", 7}}), fx.table);
  assert(se.kind == ServerError::Kind::kKeyRotation);
  assert(se.key_id == 7u);

  se = ClassifyServerError(
      JsonResponse(400, {{"error", "key"}, {"key_id", "8"}}), fx.table);
  assert(se.kind == ServerError::Kind::kKeyRotation);
  assert(se.key_id == 8u);

  se = ClassifyServerError(
      JsonResponse(400, {{"error", "key"}, {"key_id", 99}}), fx.table);
  assert(se.kind == ServerError::Kind::kUnknownKey);
  Error error;
  ServerErrorToError(se, error);
  assert(error.code == ErrorCode::kUnknownServerKey);

  se = ClassifyServerError(
      JsonResponse(403, {{"result_code", "access_denied"},
                         {"message", "Unable to validate application access"}}),
      fx.table);
  assert(se.kind == ServerError::Kind::kAccessDenied);
  ServerErrorToError(se, error);
  assert(error.code == ErrorCode::kAccessDenied);
  assert(error.message ==
         "Error: access_denied, message=Unable to validate application access");

  se = ClassifyServerError(
      JsonResponse(401, {{"error", "unauthorized"},
                         {"message", "signature is invalid"}}),
      fx.table);
  assert(se.kind == ServerError::Kind::kAccessDenied);

  se = ClassifyServerError(
      JsonResponse(403, {{"result_code", "invalid_client_version"},
                         {"message", "Client version is not supported"},
                         {"additional_info", "upgrade"}}),
      fx.table);
  assert(se.kind == ServerError::Kind::kClientVersion);
  ServerErrorToError(se, error);
  assert(error.code == ErrorCode::kAccessDenied);
  assert(error.message.find("additional_info=upgrade") != std::string::npos);

  se = ClassifyServerError(
      JsonResponse(400, {{"result_code", "out_of_date"}, {"message", "stale"}}),
      fx.table);
  assert(se.kind == ServerError::Kind::kRevisionConflict);
  ServerErrorToError(se, error);
  assert(error.code == ErrorCode::kRevisionConflict);

  HttpResponse conflict;
  conflict.status = 409;
  conflict.body = common::StringToBytes("Conflict");
  se = ClassifyServerError(conflict, fx.table);
  assert(se.kind == ServerError::Kind::kRevisionConflict);

  HttpResponse gateway;
  gateway.status = 502;
  se = ClassifyServerError(gateway, fx.table);
  assert(se.kind == ServerError::Kind::kOther);
  ServerErrorToError(se, error);
  assert(error.code == ErrorCode::kServer);
  assert(error.message.find("502") != std::string::npos);
}

}  // namespace

int main() {
  Fixture fx;
  TestPayloadJson();
  TestSignedRequest(fx);
  TestDecryptResponse(fx);
  TestClassify(fx);
  return 0;
}
