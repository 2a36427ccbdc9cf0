#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "fake_session.hpp"
#include "ferry/client/local_session.hpp"
#include "ferry/client/sync_engine.hpp"
#include "ferry/crypto.hpp"
#include "ferry/errors.hpp"

using namespace ferry;
using namespace ferry::client;
using namespace ferry::testing;

namespace
{

    Site local_site(const std::filesystem::path &root)
    {
        Site site;
        site.id = "local";
        site.name = "local";
        site.protocol = "file";
        site.hostname = root.string();
        return site;
    }

    template <typename Exception, typename Fn>
    bool throws_with(Fn &&fn, ErrorCode code)
    {
        try
        {
            fn();
        }
        catch (const Exception &ex)
        {
            return ex.code() == code;
        }
        return false;
    }

    void test_connect_and_paths()
    {
        const auto root = scratch_directory("local_paths");
        LocalSession missing(local_site(root / "absent"));
        assert(throws_with<ConnectionError>([&]
                                            { missing.connect(); }, ErrorCode::ConnectionFailed));

        LocalSession session(local_site(root));
        assert(throws_with<ConnectionError>([&]
                                            { (void)session.stat("/"); }, ErrorCode::ConnectionFailed));
        session.connect();
        assert(session.is_connected());

        const auto top = session.stat("/");
        assert(top.is_directory());
        assert(top.path == "/");

        assert(throws_with<FileOperationError>([&]
                                               { (void)session.stat("/../etc/passwd"); }, ErrorCode::InvalidPath));
        assert(throws_with<FileOperationError>([&]
                                               { (void)session.stat("/nothing"); }, ErrorCode::NotFound));
        assert(!session.exists("/nothing"));

        session.mkdir("/a/b", true);
        assert(throws_with<FileOperationError>([&]
                                               { session.mkdir("/a", false); }, ErrorCode::AlreadyExists));
        session.change_directory("/a");
        assert(session.working_directory() == "/a");
        assert(session.stat("b").path == "/a/b");
        assert(throws_with<FileOperationError>([&]
                                               { session.change_directory("/missing"); }, ErrorCode::NotFound));

        session.disconnect();
        assert(!session.is_connected());
        cleanup_path(root);
    }

    void test_file_operations()
    {
        const auto root = scratch_directory("local_files");
        const auto outside = scratch_directory("local_files_outside");
        LocalSession session(local_site(root));
        session.connect();

        const std::string payload(200 * 1024, 'z');
        write_file(outside / "source.bin", payload);

        std::vector<std::uint64_t> reported;
        session.upload(outside / "source.bin", "/incoming.bin", [&](std::uint64_t transferred, std::uint64_t total)
                       {
            assert(total == payload.size());
            reported.push_back(transferred); });
        assert(reported.size() == 4);
        assert(reported.back() == payload.size());
        assert(read_file(root / "incoming.bin") == payload);
        assert(std::filesystem::last_write_time(root / "incoming.bin") ==
               std::filesystem::last_write_time(outside / "source.bin"));

        assert(throws_with<FileOperationError>([&]
                                               { session.upload(outside / "source.bin", "/no/parent.bin", {}); },
                                               ErrorCode::NotFound));
        assert(throws_with<LocalIOError>([&]
                                         { session.upload(outside / "absent.bin", "/absent.bin", {}); },
                                         ErrorCode::NotFound));

        const auto listing = session.list_directory("/");
        assert(listing.size() == 1);
        assert(listing.front().name == "incoming.bin");
        assert(listing.front().size == payload.size());
        assert(listing.front().permissions.has_value());

        // Partial files from interrupted transfers are not listed.
        write_file(root / "leftover.bin.ferry-part", "x");
        assert(session.list_directory("/").size() == 1);

        session.download("/incoming.bin", outside / "copy.bin", {});
        assert(read_file(outside / "copy.bin") == payload);

        const auto sum = session.checksum("/incoming.bin", crypto::kChecksumAlgorithm);
        assert(sum == crypto::hash_file(outside / "source.bin"));
        assert(!session.checksum("/incoming.bin", "md5").has_value());

        session.rename("/incoming.bin", "/renamed.bin");
        assert(session.exists("/renamed.bin"));
        assert(!session.exists("/incoming.bin"));

        session.chmod("/renamed.bin", 0600);
        assert(session.stat("/renamed.bin").permissions == "rw-------");

        session.mkdir("/dir", false);
        write_file(root / "dir" / "inside.txt", "i");
        assert(throws_with<FileOperationError>([&]
                                               { session.remove("/dir"); }, ErrorCode::IsADirectory));
        assert(throws_with<FileOperationError>([&]
                                               { session.rmdir("/dir"); }, ErrorCode::IoFailure));
        session.remove("/dir/inside.txt");
        session.rmdir("/dir");
        assert(!session.exists("/dir"));
        assert(throws_with<FileOperationError>([&]
                                               { session.rmdir("/renamed.bin"); }, ErrorCode::NotADirectory));

        cleanup_path(root);
        cleanup_path(outside);
    }

    void test_session_factory()
    {
        SessionFactory factory;
        register_builtin_protocols(factory);
        const auto protocols = factory.supported_protocols();
        assert(protocols == std::vector<std::string>{"file"});

        const auto root = scratch_directory("factory");
        auto site = local_site(root);
        site.protocol = "FILE";
        auto session = factory.create(site);
        assert(session != nullptr);
        assert(!session->is_connected());
        session->connect();
        assert(session->site().id == "local");

        site.protocol = "gopher";
        bool threw = false;
        try
        {
            (void)factory.create(site);
        }
        catch (const ConfigurationError &)
        {
            threw = true;
        }
        assert(threw);
        cleanup_path(root);
    }

    void test_mirror_between_directories()
    {
        const auto source = scratch_directory("mirror_source");
        const auto target = scratch_directory("mirror_target");
        write_file(source / "docs" / "a.txt", "alpha");
        write_file(source / "b.txt", "beta");
        write_file(target / "obsolete.txt", "old");

        LocalSession session(local_site(target));
        session.connect();

        SyncProfile profile;
        profile.id = "mirror";
        profile.name = "mirror";
        profile.site_id = "local";
        profile.local_path = source;
        profile.remote_path = "/";
        profile.mode = SyncMode::Mirror;
        profile.delete_extra = true;

        SyncEngine engine;
        const auto result = engine.execute(profile, session);
        assert(result.error_count() == 0);
        assert(result.success_count() == 4);
        assert(read_file(target / "docs" / "a.txt") == "alpha");
        assert(read_file(target / "b.txt") == "beta");
        assert(!std::filesystem::exists(target / "obsolete.txt"));

        assert(engine.compare(profile, session).empty());

        cleanup_path(source);
        cleanup_path(target);
    }

    void test_linked_files_compare_by_target()
    {
        const auto source = scratch_directory("linked_source");
        const auto target = scratch_directory("linked_target");
        const auto stamp = std::filesystem::file_time_type::clock::now() - std::chrono::hours(1);
        write_file(source / "shared.txt", "payload");
        std::filesystem::last_write_time(source / "shared.txt", stamp);
        write_file(target / "store" / "shared.txt", "payload");
        std::filesystem::last_write_time(target / "store" / "shared.txt", stamp);
        std::error_code ec;
        std::filesystem::create_symlink(target / "store" / "shared.txt", target / "shared.txt", ec);
        if (ec)
        {
            cleanup_path(source);
            cleanup_path(target);
            return;
        }

        LocalSession session(local_site(target));
        session.connect();
        const auto linked = session.stat("/shared.txt");
        assert(linked.type == FileType::Link);
        assert(linked.size == 7);

        SyncProfile profile;
        profile.id = "linked";
        profile.name = "linked";
        profile.site_id = "local";
        profile.local_path = source;
        profile.remote_path = "/";
        profile.mode = SyncMode::UploadOnly;

        SyncEngine engine;
        assert(engine.compare(profile, session).empty());

        cleanup_path(source);
        cleanup_path(target);
    }

} // namespace

void run_local_session_tests()
{
    test_connect_and_paths();
    test_file_operations();
    test_session_factory();
    test_mirror_between_directories();
    test_linked_files_compare_by_target();
}
