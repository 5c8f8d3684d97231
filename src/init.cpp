// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <init.h>

#include <fraud/alert_broadcaster.h>
#include <fraud/fraud_db.h>
#include <fraud/threat_cluster_engine.h>
#include <guard/giftcard_store.h>
#include <guard/guard_config.h>
#include <guard/rate_limiter.h>
#include <guard/redemption_guard.h>
#include <guard/replay_guard.h>
#include <httpserver.h>
#include <httpserver/fraud_rest.h>
#include <scheduler.h>
#include <util.h>
#include <utilstrencodings.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <sys/stat.h>

#include <boost/bind.hpp>
#include <boost/thread.hpp>

static const char* const FRAUD_DB_FILENAME = "fraud.sqlite";

using namespace giftguard;

//////////////////////////////////////////////////////////////////////////////
//
// Shutdown
//

//
// Thread management and startup/shutdown:
//
// The network-processing threads are all part of a thread group
// created by AppInit().
//
// A clean exit happens when StartShutdown() or the SIGTERM
// signal handler sets fRequestShutdown, which makes main thread's
// WaitForShutdown() interrupts the thread group.
// And then, WaitForShutdown() makes all other on-going threads
// in the thread group join the main thread.
// Shutdown() is then called to clean up database connections, and stop other
// threads that should only be stopped after the main network-processing
// threads have exited.
//

std::atomic<bool> fRequestShutdown(false);

void StartShutdown()
{
    fRequestShutdown = true;
}
bool ShutdownRequested()
{
    return fRequestShutdown;
}

static GuardConfig g_guardConfig;
static std::unique_ptr<FraudDB> g_fraudDB;
static std::unique_ptr<RateLimitStore> g_rateLimitStore;
static std::unique_ptr<ReplayGuard> g_replayGuard;
static std::unique_ptr<MemoryGiftCardStore> g_giftCards;
static std::unique_ptr<AlertBroadcaster> g_alertBroadcaster;
static std::unique_ptr<RedemptionGuard> g_redemptionGuard;
static std::unique_ptr<ThreatClusterEngine> g_clusterEngine;

void Interrupt()
{
    InterruptHTTPServer();
}

void Shutdown()
{
    LogPrintf("%s: In progress...\n", __func__);
    static CCriticalSection cs_Shutdown;
    TRY_LOCK(cs_Shutdown, lockShutdown);
    if (!lockShutdown)
        return;

    /// Note: Shutdown() must be able to handle cases in which initialization failed part of the way,
    /// for example if the data directory was found to be locked.
    /// Be sure that anything that writes files or flushes caches only does this if the respective
    /// module was initialized.
    RenameThread("giftguard-shutoff");
    StopFraudRESTHandlers();
    StopHTTPServer();

    // Components go in reverse construction order; the database last.
    g_clusterEngine.reset();
    g_redemptionGuard.reset();
    g_alertBroadcaster.reset();
    g_giftCards.reset();
    g_replayGuard.reset();
    g_rateLimitStore.reset();
    if (g_fraudDB) {
        g_fraudDB->Close();
        g_fraudDB.reset();
    }

    LogPrintf("%s: done\n", __func__);
}

/**
 * Signal handlers are very limited in what they are allowed to do.
 * The execution context the handler is invoked in is not guaranteed,
 * so we restrict handler operations to just touching variables:
 */
static void HandleSIGTERM(int)
{
    fRequestShutdown = true;
}

static void HandleSIGHUP(int)
{
    fReopenDebugLog = true;
}

static void registerSignalHandler(int signal, void(*handler)(int))
{
    struct sigaction sa;
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(signal, &sa, nullptr);
}

std::string HelpMessage()
{
    std::string strUsage = HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "Print this help message and exit");
    strUsage += HelpMessageOpt("-version", "Print version and exit");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file. Relative paths will be prefixed by datadir location. (default: %s)", GIFTGUARD_CONF_FILENAME));
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");
    strUsage += HelpMessageOpt("-seedcard=<code:amount>", "Add a gift card with the given balance in cents to the in-memory ledger (can be specified multiple times)");

    strUsage += HelpMessageGroup("Debugging/Testing options:");
    strUsage += HelpMessageOpt("-debug=<category>", strprintf("Output debugging information (default: %u, supplying <category> is optional)", 0) + ". " +
        "If <category> is not supplied or if <category> = 1, output all debugging information. <category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-debugexclude=<category>", strprintf("Exclude debugging information for a category. Can be used in conjunction with -debug=1 to output debug logs for all categories except one or more specified categories."));
    strUsage += HelpMessageOpt("-debuglogfile=<file>", strprintf("Specify location of debug log file: this can be an absolute path or a path relative to the data directory (default: %s)", "debug.log"));
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-logips", strprintf("Include IP addresses in debug output (default: %u)", DEFAULT_LOGIPS));
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to console instead of debug.log file");

    strUsage += GetGuardHelpMessage();

    strUsage += HelpMessageGroup("HTTP server options:");
    strUsage += HelpMessageOpt("-rpcbind=<addr>[:port]", "Bind to given address to listen for HTTP connections. This option can be specified multiple times (default: 127.0.0.1 and ::1 i.e., localhost)");
    strUsage += HelpMessageOpt("-rpcport=<port>", strprintf("Listen for HTTP connections on <port> (default: %u)", DEFAULT_HTTP_PORT));
    strUsage += HelpMessageOpt("-rpcthreads=<n>", strprintf("Set the number of threads to service HTTP calls (default: %d)", DEFAULT_HTTP_THREADS));
    strUsage += HelpMessageOpt("-rpcworkqueue=<n>", strprintf("Set the depth of the work queue to service HTTP calls (default: %d)", DEFAULT_HTTP_WORKQUEUE));
    strUsage += HelpMessageOpt("-rpcservertimeout=<n>", strprintf("Timeout during HTTP requests (default: %d)", DEFAULT_HTTP_SERVER_TIMEOUT));
    strUsage += HelpMessageOpt("-adminkey=<key>", "Value of the X-Admin-Key header that grants access to the /admin endpoints");
    strUsage += HelpMessageOpt("-merchantkey=<key>", "Value of the X-Merchant-Key header that identifies merchant callers");

    return strUsage;
}

std::string LicenseInfo()
{
    return FormatParagraph("Copyright (C) 2024 The Cascoin Core developers") + "\n" +
           "\n" +
           FormatParagraph("This is experimental software.") + "\n" +
           "\n" +
           FormatParagraph("Distributed under the MIT software license, see the accompanying file COPYING or <https://opensource.org/licenses/MIT>") + "\n";
}

/** Sanity checks
 *  Ensure that giftguard is running in a usable environment with all
 *  necessary library support.
 */
static bool InitSanityCheck()
{
    std::string digest = HashIdentityString("sanity");
    if (digest.empty() || digest != HashIdentityString("sanity")) {
        return InitError("Identity hash sanity check failed. Aborting.");
    }
    return true;
}

static bool AppInitServers()
{
    if (!InitHTTPServer())
        return false;

    FraudRESTContext context;
    context.guard = g_redemptionGuard.get();
    context.logStore = g_fraudDB.get();
    context.clusterStore = g_fraudDB.get();
    context.engine = g_clusterEngine.get();
    context.broadcaster = g_alertBroadcaster.get();
    InitFraudRESTHandlers(context);

    if (!StartHTTPServer())
        return false;
    return true;
}

// Parameter interaction based on rules
void InitParameterInteraction()
{
    // -rpcbind without -adminkey leaves the admin surface closed; say so once
    if (gArgs.IsArgSet("-rpcbind") && gArgs.GetArg("-adminkey", "").empty()) {
        LogPrintf("%s: parameter interaction: -rpcbind set without -adminkey, admin endpoints stay closed\n", __func__);
    }
}

void InitLogging()
{
    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", false);
    fPrintToDebugLog = !fPrintToConsole;
    fLogTimestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    fLogIPs = gArgs.GetBoolArg("-logips", DEFAULT_LOGIPS);

    LogPrintf("\n\n\n\n\n");
    LogPrintf("Giftguard version %s\n", "1.0.0");
}

bool AppInitBasicSetup()
{
    // ********************************************************* Step 1: setup
    umask(077);

    // Clean shutdown on SIGTERM
    registerSignalHandler(SIGTERM, HandleSIGTERM);
    registerSignalHandler(SIGINT, HandleSIGTERM);

    // Reopen debug.log on SIGHUP
    registerSignalHandler(SIGHUP, HandleSIGHUP);

    // Ignore SIGPIPE, otherwise it will bring the daemon down if the client closes unexpectedly
    signal(SIGPIPE, SIG_IGN);

    return true;
}

bool AppInitParameterInteraction()
{
    // ********************************************************* Step 2: parameter interactions

    // -debug can be specified multiple times
    if (gArgs.IsArgSet("-debug")) {
        // Special-case: if -debug=0/-nodebug is set, turn off debugging messages
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");

        if (std::none_of(categories.begin(), categories.end(),
            [](std::string cat){return cat == "0" || cat == "none";})) {
            for (const auto& cat : categories) {
                uint32_t flag = 0;
                if (!GetLogCategory(&flag, &cat)) {
                    InitWarning(strprintf("Unsupported logging category %s=%s.", "-debug", cat));
                    continue;
                }
                logCategories |= flag;
            }
        }
    }

    // Now remove the logging categories which were explicitly excluded
    for (const std::string& cat : gArgs.GetArgs("-debugexclude")) {
        uint32_t flag = 0;
        if (!GetLogCategory(&flag, &cat)) {
            InitWarning(strprintf("Unsupported logging category %s=%s.", "-debugexclude", cat));
            continue;
        }
        logCategories &= ~flag;
    }

    int64_t rpcThreads = gArgs.GetArg("-rpcthreads", DEFAULT_HTTP_THREADS);
    if (rpcThreads <= 0) {
        return InitError(strprintf("Invalid value for -rpcthreads: %d", rpcThreads));
    }
    int64_t rpcPort = gArgs.GetArg("-rpcport", DEFAULT_HTTP_PORT);
    if (rpcPort <= 0 || rpcPort > 65535) {
        return InitError(strprintf("Invalid port specified in -rpcport: '%d'", rpcPort));
    }

    return InitGuardConfig(g_guardConfig);
}

bool AppInitMain(boost::thread_group& threadGroup, CScheduler& scheduler)
{
    // ********************************************************* Step 3: sanity checks
    if (!InitSanityCheck())
        return false;

    if (fPrintToDebugLog) {
        if (!OpenDebugLog()) {
            return InitError(strprintf("Could not open debug log file %s", GetDebugLogPath().string()));
        }
    }

    if (!fLogTimestamps)
        LogPrintf("Startup time: %s\n", DateTimeStrFormat("%Y-%m-%d %H:%M:%S", GetTime()));
    LogPrintf("Default data directory %s\n", GetDefaultDataDir().string());
    LogPrintf("Using data directory %s\n", GetDataDir().string());
    LogPrintf("Using config file %s\n", GetConfigFile(gArgs.GetArg("-conf", GIFTGUARD_CONF_FILENAME)).string());

    // Start the lightweight task scheduler thread
    CScheduler::Function serviceLoop = boost::bind(&CScheduler::serviceQueue, &scheduler);
    threadGroup.create_thread(boost::bind(&TraceThread<CScheduler::Function>, "scheduler", serviceLoop));

    // ********************************************************* Step 4: fraud database
    fs::path dbPath = GetDataDir() / FRAUD_DB_FILENAME;
    g_fraudDB.reset(new FraudDB());
    if (!g_fraudDB->Open(dbPath.string())) {
        return InitError(strprintf("Unable to open fraud database %s", dbPath.string()));
    }

    // ********************************************************* Step 5: guard components
    if (g_guardConfig.rateLimitBackend == RATE_LIMIT_BACKEND_DB) {
        g_rateLimitStore.reset(new DBRateLimitStore(*g_fraudDB));
    } else {
        g_rateLimitStore.reset(new MemoryRateLimitStore());
    }

    g_replayGuard.reset(new ReplayGuard(g_guardConfig.reservationTimeoutMs, g_fraudDB.get()));
    try {
        g_replayGuard->LoadCommitted();
    } catch (const FraudDBError& e) {
        return InitError(strprintf("Unable to load redeemed codes: %s", e.what()));
    }

    g_giftCards.reset(new MemoryGiftCardStore());
    for (const std::string& seed : gArgs.GetArgs("-seedcard")) {
        std::string code;
        int64_t amount = 0;
        if (!MemoryGiftCardStore::ParseSeed(seed, code, amount)) {
            return InitError(strprintf("Invalid -seedcard '%s' (expected CODE:AMOUNT)", SanitizeString(seed)));
        }
        g_giftCards->AddCard(code, amount);
    }
    LogPrintf("Gift card ledger seeded with %u cards\n", gArgs.GetArgs("-seedcard").size());

    g_alertBroadcaster.reset(new AlertBroadcaster(g_guardConfig.alertQueueSize));
    g_redemptionGuard.reset(new RedemptionGuard(g_guardConfig.policy, *g_rateLimitStore, *g_replayGuard,
                                                *g_giftCards, *g_fraudDB, g_alertBroadcaster.get()));
    g_clusterEngine.reset(new ThreatClusterEngine(g_guardConfig.cluster, *g_fraudDB, *g_fraudDB,
                                                  g_alertBroadcaster.get()));

    // ********************************************************* Step 6: background jobs
    RedemptionGuard* guard = g_redemptionGuard.get();
    AlertBroadcaster* broadcaster = g_alertBroadcaster.get();
    const int64_t sessionTimeoutMs = g_guardConfig.alertSessionTimeoutMs;
    scheduler.scheduleEvery([guard, broadcaster, sessionTimeoutMs] {
        const int64_t now = GetTimeMillis();
        size_t removed = guard->Sweep(now);
        size_t expired = broadcaster->ExpireIdleSessions(now, sessionTimeoutMs);
        LogPrint(BCLog::RATELIMIT, "Sweep removed %u idle entries and %u monitoring sessions\n", removed, expired);
    }, g_guardConfig.sweepIntervalMs);

    if (g_guardConfig.cluster.intervalMs > 0) {
        ThreatClusterEngine* engine = g_clusterEngine.get();
        scheduler.scheduleEvery([engine] {
            engine->RunScheduled();
        }, g_guardConfig.cluster.intervalMs);
    } else {
        LogPrintf("Scheduled threat clustering disabled\n");
    }

    // ********************************************************* Step 7: start servers
    if (!AppInitServers())
        return InitError("Unable to start HTTP server. See debug log for details.");

    LogPrintf("Giftguard ready\n");
    return !fRequestShutdown;
}
