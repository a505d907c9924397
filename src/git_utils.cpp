#include "git_utils.hpp"
#include <cstdlib>
#include <fstream>
#include "options.hpp"

using namespace std;

namespace git {

/**
 * @brief Read credentials from a file.
 *
 * The file is expected to contain the username on the first line and the
 * password on the second line.
 *
 * @return True if both username and password were read.
 */
static bool read_credential_file(const fs::path& path, std::string& user, std::string& pass) {
    std::ifstream ifs(path);
    if (!ifs)
        return false;
    std::getline(ifs, user);
    std::getline(ifs, pass);
    return !user.empty() && !pass.empty();
}

static std::optional<std::string> safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) == 0 && buf) {
        std::string v(buf);
        free(buf);
        return v;
    }
    return std::nullopt;
#else
    const char* v = std::getenv(name);
    if (v)
        return std::string(v);
    return std::nullopt;
#endif
}

int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload) {
    (void)url;
    const PublishOptions* opts = static_cast<const PublishOptions*>(payload);
    auto env_user = safe_getenv("GIT_USERNAME");
    auto env_pass = safe_getenv("GIT_PASSWORD");
    std::string file_user;
    std::string file_pass;
    if (opts && !opts->credential_file.empty())
        read_credential_file(opts->credential_file, file_user, file_pass);
    const char* user =
        username_from_url
            ? username_from_url
            : (!file_user.empty() ? file_user.c_str() : (env_user ? env_user->c_str() : nullptr));
    if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && opts && !opts->ssh_private_key.empty() &&
        user) {
        const char* pub = nullptr;
        std::string pub_buf;
        if (!opts->ssh_public_key.empty()) {
            pub_buf = opts->ssh_public_key.string();
            pub = pub_buf.c_str();
        }
        if (git_credential_ssh_key_new(out, user, pub, opts->ssh_private_key.string().c_str(),
                                       "") == 0)
            return 0; // prefer explicit SSH key
    }
    if ((allowed_types & GIT_CREDENTIAL_USERNAME) && user) {
        if (git_credential_username_new(out, user) == 0)
            return 0;
    }
    if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && user) {
        if (git_credential_ssh_key_from_agent(out, user) == 0)
            return 0;
    }
    if (allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) {
        if (!file_user.empty() && !file_pass.empty())
            return git_credential_userpass_plaintext_new(out, file_user.c_str(),
                                                         file_pass.c_str());
        if (env_user && env_pass)
            return git_credential_userpass_plaintext_new(out, env_user->c_str(),
                                                         env_pass->c_str());
    }
    return git_credential_default_new(out);
}

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

static git_repository* open_repo(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, repo.string().c_str(), 0, nullptr) != 0) {
        set_error(error);
        return nullptr;
    }
    return raw;
}

optional<string> get_remote_url(const fs::path& repo, const string& remote, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    remote_ptr remote_handle(raw_remote);
    const char* url = git_remote_url(remote_handle.get());
    if (!url) {
        set_error(error);
        return nullopt;
    }
    return string(url);
}

bool is_github_url(const string& url) { return url.find("github.com") != string::npos; }

optional<string> github_slug_from_url(const string& url) {
    if (!is_github_url(url))
        return nullopt;
    string rest;
    const string host = "github.com";
    size_t pos = url.find(host);
    size_t after = pos + host.size();
    if (after >= url.size() || (url[after] != '/' && url[after] != ':'))
        return nullopt;
    // A port after the host ("github.com:22/owner/name") belongs to ssh:// URLs.
    rest = url.substr(after + 1);
    if (url[after] == ':' && url.compare(0, 6, "ssh://") == 0) {
        size_t slash = rest.find('/');
        if (slash == string::npos)
            return nullopt;
        rest = rest.substr(slash + 1);
    }
    while (!rest.empty() && rest.back() == '/')
        rest.pop_back();
    if (rest.size() > 4 && rest.compare(rest.size() - 4, 4, ".git") == 0)
        rest.erase(rest.size() - 4);
    size_t slash = rest.find('/');
    if (slash == string::npos || slash == 0 || slash + 1 == rest.size() ||
        rest.find('/', slash + 1) != string::npos)
        return nullopt;
    return rest;
}

/**
 * @brief Resolve the commit a tag reference points at.
 *
 * @return `true` and fills @p out when `refs/tags/<tag>` exists.
 */
static bool lookup_tag_target(git_repository* repo, const string& tag, git_oid& out) {
    git_reference* raw_ref = nullptr;
    string refname = "refs/tags/" + tag;
    if (git_reference_lookup(&raw_ref, repo, refname.c_str()) != 0)
        return false;
    reference_ptr ref(raw_ref);
    git_object* raw_obj = nullptr;
    if (git_reference_peel(&raw_obj, ref.get(), GIT_OBJECT_COMMIT) != 0)
        return false;
    object_ptr obj(raw_obj);
    git_oid_cpy(&out, git_object_id(obj.get()));
    return true;
}

bool tag_exists(const fs::path& repo, const string& tag) {
    repo_ptr r(open_repo(repo, nullptr));
    if (!r.get())
        return false;
    git_oid oid;
    return lookup_tag_target(r.get(), tag, oid);
}

bool create_tag(const fs::path& repo, const string& tag, const string& message, bool* existed,
                string* error) {
    if (existed)
        *existed = false;
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return false;
    git_object* raw_head = nullptr;
    if (git_revparse_single(&raw_head, r.get(), "HEAD^{commit}") != 0) {
        set_error(error);
        return false;
    }
    object_ptr head(raw_head);

    git_oid current;
    if (lookup_tag_target(r.get(), tag, current)) {
        if (git_oid_equal(&current, git_object_id(head.get()))) {
            if (existed)
                *existed = true;
            return true;
        }
        if (error)
            *error = "tag " + tag + " already exists on " + oid_to_hex(current);
        return false;
    }

    git_oid tag_oid;
    git_signature* raw_sig = nullptr;
    int rc = 0;
    if (git_signature_default(&raw_sig, r.get()) == 0) {
        signature_ptr sig(raw_sig);
        rc = git_tag_create(&tag_oid, r.get(), tag.c_str(), head.get(), sig.get(),
                            message.c_str(), 0);
    } else {
        rc = git_tag_create_lightweight(&tag_oid, r.get(), tag.c_str(), head.get(), 0);
    }
    if (rc != 0) {
        set_error(error);
        return false;
    }
    return true;
}

namespace {
struct PushContext {
    const PublishOptions* creds = nullptr;
    int credential_attempts = 0;
    bool auth_exhausted = false;
    std::string rejected;
};

int push_credentials(git_credential** out, const char* url, const char* username_from_url,
                     unsigned int allowed_types, void* payload) {
    auto* ctx = static_cast<PushContext*>(payload);
    // libgit2 keeps asking while authentication fails; give up eventually.
    if (++ctx->credential_attempts > 5) {
        ctx->auth_exhausted = true;
        return GIT_EUSER;
    }
    return credential_cb(out, url, username_from_url, allowed_types,
                         const_cast<PublishOptions*>(ctx->creds));
}

int push_update_reference(const char* refname, const char* status, void* payload) {
    auto* ctx = static_cast<PushContext*>(payload);
    if (status)
        ctx->rejected = std::string(refname ? refname : "") + ": " + status;
    return 0;
}
} // namespace

bool push_tag(const fs::path& repo, const string& remote, const string& tag,
              const PublishOptions* creds, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return false;
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error);
        return false;
    }
    remote_ptr remote_handle(raw_remote);

    PushContext ctx;
    ctx.creds = creds;
    git_push_options push_opts = GIT_PUSH_OPTIONS_INIT;
    push_opts.callbacks.credentials = push_credentials;
    push_opts.callbacks.push_update_reference = push_update_reference;
    push_opts.callbacks.payload = &ctx;

    string refspec = "refs/tags/" + tag + ":refs/tags/" + tag;
    char* specs[] = {const_cast<char*>(refspec.c_str())};
    git_strarray refspecs = {specs, 1};
    if (git_remote_push(remote_handle.get(), &refspecs, &push_opts) != 0) {
        if (ctx.auth_exhausted && error)
            *error = "authentication failed for remote " + remote;
        else
            set_error(error);
        return false;
    }
    if (!ctx.rejected.empty()) {
        if (error)
            *error = "remote rejected " + ctx.rejected;
        return false;
    }
    return true;
}

} // namespace git
