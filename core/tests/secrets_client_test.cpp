#include <cassert>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "binding.h"
#include "config_store.h"
#include "encoding_utils.h"
#include "secrets_client.h"
#include "test_support.h"

using nlohmann::json;
using namespace ksm::core;
using ksm::test::FakeBackend;
namespace common = ksm::common;

namespace {

json LoginData(const std::string& title, const std::string& password) {
  return {{"title", title},
          {"type", "login"},
          {"notes", "managed by ci"},
          {"fields",
           json::array(
               {{{"type", "login"}, {"value", json::array({"svc"})}},
                {{"type", "password"}, {"value", json::array({password})}},
                {{"type", "phone"},
                 {"value", json::array({{{"number", "555-0100"}},
                                        {{"number", "555-0199"}}})}}})}};
}

struct Harness {
  std::shared_ptr<FakeBackend> backend = std::make_shared<FakeBackend>();
  std::shared_ptr<ConfigStore> store =
      std::make_shared<ConfigStore>(MemoryBackend{});

  SecretsClientOptions Options(bool with_token) const {
    SecretsClientOptions options;
    options.store = store;
    options.transport = backend;
    options.key_table = &backend->table();
    options.hostname = std::string(FakeBackend::kHost);
    if (with_token) {
      options.token = backend->Token();
    }
    return options;
  }
};

void TestBindingAndFetch() {
  Harness h;
  h.backend->AddRecord("rec-direct", LoginData("Database", "pw-1"));
  h.backend->AddRecord("rec-shared", LoginData("Shared Login", "pw-2"),
                       FakeBackend::kSharedFolder);
  h.backend->AddSingleShareRecord("rec-single", LoginData("Single", "pw-3"));
  h.backend->AddFile("rec-direct", "file-1", "cert.pem", "Certificate",
                     "-----BEGIN-----");

  SecretsClient client(h.Options(true));
  Error error;
  assert(client.Init(error));
  assert(BindingStateOf(h.store->Snapshot()) == BindingState::kBinding);

  RecordGraph graph;
  assert(client.GetSecrets({}, graph, error));
  assert(BindingStateOf(h.store->Snapshot()) == BindingState::kBound);
  assert(!h.store->Contains(config_keys::kClientKey));
  assert(h.store->Contains(config_keys::kAppOwnerPublicKey));
  // Binding call plus the confirming fetch.
  assert(h.backend->calls["get_secret"] == 2);
  assert(h.backend->payloads[0].contains("publicKey"));
  assert(!h.backend->payloads[1].contains("publicKey"));
  assert(h.backend->payloads[0]["clientVersion"] == kClientVersion);

  assert(graph.records().size() == 3);
  const KeeperRecord* shared = graph.FindRecord("rec-shared");
  assert(shared && shared->folder_uid == FakeBackend::kSharedFolder);
  assert(graph.FindRecord("rec-single")->Title() == "Single");

  const KeeperRecord* direct = graph.FindRecord("rec-direct");
  assert(direct && direct->files.size() == 1);
  std::vector<std::uint8_t> content;
  assert(client.DownloadFile(direct->files[0], content, error));
  assert(common::BytesToString(content) == "-----BEGIN-----");

  // A client built later on the same storage needs no token.
  SecretsClient again(h.Options(false));
  assert(again.Init(error));
  RecordGraph subset;
  assert(again.GetSecrets({"rec-shared"}, subset, error));
  assert(subset.records().size() == 1);
  assert(h.backend->payloads.back()["requestedRecords"][0] == "rec-shared");

  std::vector<std::string> uids;
  assert(again.GetSecretsByTitle("Database", uids, subset, error));
  assert(uids == std::vector<std::string>{"rec-direct"});

  std::vector<KeeperFolder> folders;
  assert(again.GetFolders(folders, error));
  assert(folders.size() == 2);
  assert(folders[1].name == "Nested");
}

void TestNotation() {
  Harness h;
  h.backend->AddRecord("rec-a", LoginData("Database", "pw-1"));
  h.backend->AddRecord("rec-b", LoginData("Twin", "x"));
  h.backend->AddRecord("rec-c", LoginData("Twin", "y"));
  h.backend->AddFile("rec-a", "file-1", "cert.pem", "Certificate", "pem");
  SecretsClient client(h.Options(true));
  Error error;
  assert(client.Init(error));

  std::optional<std::vector<std::string>> out;
  assert(client.GetNotation("rec-a/field/password", out, error));
  assert(out && (*out)[0] == "pw-1");
  assert(client.GetNotation("keeper://Database/field/phone[1][number]", out,
                            error));
  assert(out && (*out)[0] == "555-0199");
  assert(client.GetNotation("Database/notes", out, error));
  assert(out && (*out)[0] == "managed by ci");
  assert(client.GetNotation("rec-a/field/otp", out, error));
  assert(!out);
  assert(client.GetNotation("rec-a/file/cert.pem", out, error));
  assert(out && (*out)[0] == common::Base64UrlEncode(
                                 common::StringToBytes("pem")));

  assert(!client.GetNotation("Twin/field/login", out, error));
  assert(error.code == ErrorCode::kAmbiguousTitle);
  error.Clear();
  assert(!client.GetNotation("rec-a/notes/x", out, error));
  assert(error.code == ErrorCode::kUnexpectedName);
  error.Clear();
  assert(!client.GetNotation("rec-a/field/login/extra", out, error));
  assert(error.code == ErrorCode::kInvalidNotation);

  error.Clear();
  assert(client.SetNotationValue("Database/field/password", "rotated", error));
  assert(h.backend->Find("rec-a")->revision == 2);
  assert(client.GetNotation("rec-a/field/password", out, error));
  assert(out && (*out)[0] == "rotated");
}

void TestUpdates() {
  Harness h;
  h.backend->AddRecord("rec-a", LoginData("Database", "pw-1"));
  SecretsClient client(h.Options(true));
  Error error;
  assert(client.Init(error));

  RecordGraph graph;
  assert(client.GetSecrets({}, graph, error));
  KeeperRecord* record = graph.FindRecord("rec-a");
  assert(record->revision == 1);
  assert(record->SetFieldValue(FieldSection::kStandard, "password",
                               {json("pw-2")}, error));
  assert(client.UpdateSecret(graph, "rec-a", TransactionType::kRotation,
                             error));
  assert(record->revision == 2);
  assert(!record->revision_pending);
  assert(h.backend->Find("rec-a")->data["fields"][1]["value"][0] == "pw-2");
  assert(h.backend->payloads.back()["transactionType"] == "rotation");
  assert(client.CompleteTransaction("rec-a", false, error));
  assert(client.CompleteTransaction("rec-a", true, error));
  assert(h.backend->completed ==
         (std::vector<std::string>{"finalize_secret_update:rec-a",
                                   "rollback_secret_update:rec-a"}));

  // Without a revision in the reply the record is fetched again.
  h.backend->return_revision = false;
  assert(client.UpdateSecret(graph, "rec-a", std::nullopt, error));
  assert(record->revision == 3);
  assert(!record->revision_pending);

  // Someone else wrote in between.
  h.backend->Find("rec-a")->revision = 10;
  error.Clear();
  assert(!client.UpdateSecret(graph, "rec-a", std::nullopt, error));
  assert(error.code == ErrorCode::kRevisionConflict);
  assert(BindingStateOf(h.store->Snapshot()) == BindingState::kBound);

  error.Clear();
  assert(!client.UpdateSecret(graph, "missing", std::nullopt, error));
  assert(error.code == ErrorCode::kRecordNotFound);
}

void TestCreateAndDelete() {
  Harness h;
  h.backend->AddRecord("rec-a", LoginData("Database", "pw-1"));
  SecretsClient client(h.Options(true));
  Error error;
  assert(client.Init(error));
  RecordGraph graph;
  assert(client.GetSecrets({}, graph, error));

  std::string uid;
  assert(client.CreateSecret(FakeBackend::kNestedFolder,
                             LoginData("Created", "pw-new"), uid, error));
  assert(!uid.empty());
  assert(h.backend->Find(uid) != nullptr);
  assert(h.backend->created_sub_folders ==
         std::vector<std::string>{FakeBackend::kNestedFolder});

  std::optional<std::vector<std::string>> out;
  assert(client.GetNotation(uid + "/field/password", out, error));
  assert(out && (*out)[0] == "pw-new");

  assert(!client.CreateSecret("not-a-folder", LoginData("x", "y"), uid,
                              error));
  assert(error.code == ErrorCode::kKeyUnavailable);

  std::vector<std::string> deleted;
  error.Clear();
  assert(client.DeleteSecrets({"rec-a", "ghost"}, deleted, error));
  assert(deleted == std::vector<std::string>{"rec-a"});
  assert(h.backend->Find("rec-a") == nullptr);
  assert(!client.DeleteSecrets({}, deleted, error));
  assert(error.code == ErrorCode::kInvalidArgument);
}

const KeeperFolder* FolderNamed(const std::vector<KeeperFolder>& folders,
                                const std::string& uid) {
  for (const auto& folder : folders) {
    if (folder.uid == uid) return &folder;
  }
  return nullptr;
}

void TestFolderManagement() {
  Harness h;
  SecretsClient client(h.Options(true));
  Error error;
  assert(client.Init(error));
  RecordGraph graph;
  assert(client.GetSecrets({}, graph, error));

  std::string top;
  assert(client.CreateFolder(FakeBackend::kSharedFolder, "Deploy", top,
                             error));
  assert(!top.empty());
  assert(!h.backend->payloads.back().contains("parentUid"));
  std::string child;
  assert(client.CreateFolder(top, "Staging", child, error));
  assert(h.backend->payloads.back()["parentUid"] == top);
  assert(h.backend->payloads.back()["sharedFolderUid"] ==
         FakeBackend::kSharedFolder);

  std::vector<KeeperFolder> folders;
  assert(client.GetFolders(folders, error));
  const KeeperFolder* created = FolderNamed(folders, child);
  assert(created && created->name == "Staging");
  assert(created->parent_uid == top);
  assert(!created->folder_key.empty());

  // Records can go into a folder created by the application.
  std::string record_uid;
  assert(client.CreateSecret(child, LoginData("In Staging", "pw-s"),
                             record_uid, error));
  assert(h.backend->created_sub_folders.back() == child);

  assert(client.UpdateFolder(child, "Production", error));
  assert(client.GetFolders(folders, error));
  assert(FolderNamed(folders, child)->name == "Production");

  assert(!client.UpdateFolder("no-such-folder", "x", error));
  assert(error.code == ErrorCode::kKeyUnavailable);
  error.Clear();
  assert(!client.UpdateFolder(child, "", error));
  assert(error.code == ErrorCode::kInvalidArgument);
  error.Clear();
  assert(!client.CreateFolder("no-such-folder", "x", child, error));
  assert(error.code == ErrorCode::kKeyUnavailable);
  assert(child.empty());
  error.Clear();

  // A folder with children survives a plain delete.
  std::vector<std::string> deleted;
  assert(client.DeleteFolders({top, "ghost"}, false, deleted, error));
  assert(deleted.empty());
  assert(h.backend->payloads.back()["forceDeletion"] == false);
  assert(client.DeleteFolders({top}, true, deleted, error));
  assert(deleted == std::vector<std::string>{top});
  assert(client.GetFolders(folders, error));
  assert(FolderNamed(folders, top) == nullptr);

  assert(!client.DeleteFolders({}, false, deleted, error));
  assert(error.code == ErrorCode::kInvalidArgument);
}

void TestFileUpload() {
  Harness h;
  h.backend->AddRecord("rec-a", LoginData("Database", "pw-1"));
  SecretsClient client(h.Options(true));
  Error error;
  assert(client.Init(error));
  RecordGraph graph;
  assert(client.GetSecrets({}, graph, error));
  const std::int64_t revision = graph.FindRecord("rec-a")->revision;

  FileUpload upload;
  upload.name = "deploy.key";
  upload.title = "Deploy Key";
  upload.mime_type = "application/x-pem-file";
  upload.data = common::StringToBytes("-----BEGIN KEY-----");
  std::string file_uid;
  assert(client.UploadFile(graph, "rec-a", upload, file_uid, error));
  assert(!file_uid.empty());
  assert(h.backend->calls["upload"] == 1);
  // Announced size covers the GCM framing.
  assert(h.backend->announced_sizes.back() == upload.data.size() + 28);

  const KeeperRecord* owner = graph.FindRecord("rec-a");
  assert(owner && !owner->revision_pending);
  assert(owner->revision == revision + 1);
  const auto refs = owner->FieldValues(FieldSection::kStandard, "fileRef");
  assert(refs && refs->size() == 1 && (*refs)[0] == file_uid);
  const KeeperFile* file = owner->FindFile("Deploy Key");
  assert(file && file->uid == file_uid);
  assert(file->name == "deploy.key");
  assert(file->type == "application/x-pem-file");
  assert(file->size == static_cast<std::int64_t>(upload.data.size()));

  std::vector<std::uint8_t> content;
  assert(client.DownloadFile(*file, content, error));
  assert(content == upload.data);

  // A second upload appends to the same fileRef field.
  upload.name = "second.txt";
  upload.title.clear();
  std::string second_uid;
  assert(client.UploadFile(graph, "rec-a", upload, second_uid, error));
  const auto both = graph.FindRecord("rec-a")->FieldValues(
      FieldSection::kStandard, "fileRef");
  assert(both && both->size() == 2 && (*both)[1] == second_uid);
  assert(graph.FindRecord("rec-a")->FindFile("second.txt") != nullptr);

  // Storage refusing the form fails the upload and leaves the record alone.
  h.backend->upload_status = 403;
  const json before = graph.FindRecord("rec-a")->data;
  assert(!client.UploadFile(graph, "rec-a", upload, file_uid, error));
  assert(error.code == ErrorCode::kServer);
  assert(file_uid.empty());
  assert(graph.FindRecord("rec-a")->data == before);
  h.backend->upload_status = 204;

  error.Clear();
  assert(!client.UploadFile(graph, "missing", upload, file_uid, error));
  assert(error.code == ErrorCode::kRecordNotFound);
  error.Clear();
  upload.name.clear();
  assert(!client.UploadFile(graph, "rec-a", upload, file_uid, error));
  assert(error.code == ErrorCode::kInvalidArgument);
}

void TestServerErrors() {
  Harness h;
  h.backend->AddRecord("rec-a", LoginData("Database", "pw-1"));
  SecretsClient client(h.Options(true));
  Error error;
  assert(client.Init(error));
  assert(h.store->Get(config_keys::kServerPublicKeyId) == std::string("8"));

  // Exactly one retry with the key the server names.
  h.backend->required_key_id = 7;
  RecordGraph graph;
  assert(client.GetSecrets({}, graph, error));
  assert(h.backend->key_ids_seen.size() >= 2);
  assert(h.backend->key_ids_seen[0] == 8);
  assert(h.backend->key_ids_seen[1] == 7);
  assert(h.store->Get(config_keys::kServerPublicKeyId) == std::string("7"));

  h.backend->key_ids_seen.clear();
  h.backend->required_key_id = 99;
  error.Clear();
  assert(!client.GetSecrets({}, graph, error));
  assert(error.code == ErrorCode::kUnknownServerKey);
  assert(h.backend->key_ids_seen.size() == 1);
  h.backend->required_key_id.reset();

  h.backend->deny_access = true;
  const int before = h.backend->calls["get_secret"];
  error.Clear();
  assert(!client.GetSecrets({}, graph, error));
  assert(error.code == ErrorCode::kAccessDenied);
  assert(error.message == "Error: access_denied, message=application revoked");
  assert(h.backend->calls["get_secret"] == before + 1);
  h.backend->deny_access = false;

  h.backend->network_down = true;
  error.Clear();
  assert(!client.GetSecrets({}, graph, error));
  assert(error.code == ErrorCode::kNetwork);
  h.backend->network_down = false;

  // A second device cannot reuse a redeemed token.
  auto other_store = std::make_shared<ConfigStore>(MemoryBackend{});
  SecretsClientOptions options = h.Options(true);
  options.store = other_store;
  SecretsClient intruder(options);
  assert(intruder.Init(error));
  error.Clear();
  assert(!intruder.GetSecrets({}, graph, error));
  assert(error.code == ErrorCode::kAccessDenied);
  assert(BindingStateOf(other_store->Snapshot()) == BindingState::kBinding);

  // Unbound storage without a token.
  SecretsClientOptions bare;
  bare.store = std::make_shared<ConfigStore>(MemoryBackend{});
  bare.transport = h.backend;
  bare.key_table = &h.backend->table();
  SecretsClient unbound(bare);
  assert(unbound.Init(error));
  error.Clear();
  assert(!unbound.GetSecrets({}, graph, error));
  assert(error.code == ErrorCode::kStorage);
}

void TestOfflineCache() {
  Harness h;
  h.backend->AddRecord("rec-a", LoginData("Database", "pw-1"));
  const auto dir = ksm::test::MakeTempDir("ksm_secrets_cache_test");
  SecretsClientOptions options = h.Options(true);
  options.cache_path = dir / "ksm_cache.bin";
  SecretsClient client(options);
  Error error;
  assert(client.Init(error));

  RecordGraph graph;
  assert(client.GetSecrets({}, graph, error));

  h.backend->network_down = true;
  RecordGraph cached;
  assert(client.GetSecrets({}, cached, error));
  assert(error.ok());
  const KeeperRecord* record = cached.FindRecord("rec-a");
  assert(record && record->Title() == "Database");

  std::vector<KeeperFolder> folders;
  assert(!client.GetFolders(folders, error));
  assert(error.code == ErrorCode::kNetwork);
}

}  // namespace

int main() {
  TestBindingAndFetch();
  TestNotation();
  TestUpdates();
  TestCreateAndDelete();
  TestFolderManagement();
  TestFileUpload();
  TestServerErrors();
  TestOfflineCache();
  return 0;
}
