#include "core/query/pattern_tables.h"

#include "core/shared/logging.h"

#include <iterator>

namespace hq {

namespace {

// ── Guards ──────────────────────────────────────────────────────────────

// Delimiters, template syntax, comment terminators and quote idioms. These
// are symbol sequences, so no word-boundary check applies.
constexpr const char* kInjectionSymbols[] = {
    "[inst]", "[/inst]", "<<sys>>", "<</sys>>",
    "<|im_start|>", "<|im_end|>", "<|system|>", "<|user|>", "<|assistant|>",
    "<|endoftext|>", "<|", "|>",
    "### instruction", "### system", "### response",
    "{{", "}}", "{%", "%}", "${", "<%", "%>", "#{",
    "<!--", "-->", "/*", "*/",
    "<![cdata[", "]]>",
    "<script", "</script", "javascript:", "onerror=", "onload=", "<iframe", "<img src",
    "' or '", "\" or \"", "' or 1", "\" or 1", "or 1=1", "or '1'='1", "' and '",
    "'--", "' --", "\"--", "\" --", "';", "\";", "'=", "\"=",
    "$(", "`", "&&", "||", "%00", "\\x00", "../", "..\\",
    "exec(", "eval(", "system(", "onclick=", "@@version",
    "or \"1\"=\"1",
    "[system]", "[/system]", "[assistant]", "[/assistant]",
    "<system>", "</system>", "<instructions>", "</instructions>", "<prompt>", "</prompt>",
    "###instruction", "###system", "### instructions",
};

// Statements stacked after a separator: "; select ...", "| cat ...".
constexpr const char* kStackedCommands[] = {
    "; select", ";select", "; insert", ";insert", "; update", ";update", "; delete",
    ";delete", "; drop", ";drop", "; truncate", ";truncate", "; exec", ";exec",
    "; ls", "; cat", "; rm", "| cat", "| ls", "| rm", "| sh", "| bash",
};

// Jailbreak phrasing, SQL stacking and shell markers.
constexpr const char* kInjectionWords[] = {
    "ignore all", "ignore previous", "ignore prior", "ignore the above", "ignore above",
    "ignore your", "ignore everything", "ignore instructions", "ignore the instructions",
    "ignore the rules", "ignore any previous",
    "disregard all", "disregard previous", "disregard the above", "disregard your",
    "disregard any", "disregard instructions",
    "forget your instructions", "forget all", "forget everything", "forget previous",
    "forget your rules",
    "new instructions", "override your", "override instructions", "override the system",
    "system prompt", "your prompt", "your instructions", "initial instructions",
    "original instructions", "hidden instructions", "reveal your", "print your",
    "repeat your", "output your",
    "developer mode", "dan mode", "do anything now", "jailbreak", "jailbroken",
    "pretend you are", "pretend to be", "act as if", "you are now", "roleplay as",
    "role play as", "from now on you", "from now on, you",
    "bypass your", "bypass the rules", "bypass restrictions", "bypass security",
    "bypass safety", "admin mode", "god mode", "sudo", "unrestricted mode",
    "no restrictions", "without restrictions", "without any restrictions",
    "forget your training", "forget instructions", "forget the rules",
    "pretend you have no", "pretend you are not", "act as an admin", "act as admin",
    "act as root", "act as a developer", "new persona", "override safety",
    "begin system", "reveal api", "i am the admin", "i am the developer",
    "i am the owner", "i have root access", "my password is",
    "union select", "union all select", "drop table", "drop database", "delete from",
    "insert into", "truncate table", "alter table", "select * from", "xp_cmdshell",
    "waitfor delay", "sleep(", "benchmark(", "execute immediate", "sp_executesql",
    "information_schema", "pg_catalog", "pg_tables", "sys.tables", "sys.columns",
    "sys.databases", "sysobjects", "syscolumns",
    "rm -rf", "/etc/passwd", "/etc/shadow", "wget http", "curl http", "nc -e",
    "/bin/sh", "/bin/bash", "cmd.exe", "powershell",
};

// Role tags only count at the start of a clause ("fuel system: low" is fine).
constexpr const char* kRoleTags[] = {
    "system:", "assistant:", "user:", "human:", "ai:", "developer:", "admin:",
    "root:", "instruction:", "instructions:", "(system)",
};

constexpr const char* kPasteSignatures[] = {
    "traceback (most recent call last)", "exception in thread", "stack trace:",
    "stacktrace:", "at java.", "at org.", "at com.", "nullpointerexception",
    "segmentation fault", "core dumped", "npm err!", "fatal error:",
    "$ git ", "git commit", "git push", "git pull", "git clone", "git checkout",
    "git merge", "git rebase", "docker run", "docker compose", "docker-compose",
    "docker exec", "kubectl ", "npm install", "npm run", "pip install", "apt-get",
    "yarn add", "brew install",
    "postgres://", "postgresql://", "mysql://", "mongodb://", "mongodb+srv://",
    "redis://", "amqp://", "jdbc:", "server=", "data source=",
    "#!/bin", "#include <", "import java", "def __init__", "public static void",
    "console.log(", "});", "</div>", "<html", "-----begin", "http/1.1",
    "content-type:", "user-agent:", "[error]", "[warn]", "[info]", "[debug]",
    "level=error", "level=warn", "level=info",
};

// Anywhere in the query.
constexpr const char* kNonDomainKeywords[] = {
    "weather forecast", "weather today", "weather tomorrow", "weather like",
    "weather this weekend", "the weather in",
    "bitcoin", "ethereum", "crypto", "cryptocurrency", "dogecoin", "nft", "nfts",
    "stock price", "stock prices", "stock market", "share price", "nasdaq", "dow jones",
    "sp 500", "forex", "hows the market", "how is the market", "the stock market",
    "my portfolio", "portfolio", "investment", "investments", "investing", "invest in",
    "tesla stock", "buy some tesla", "apple stock",
    "the news", "news today", "latest news", "breaking news", "headlines", "headline",
    "recipe", "recipes", "how to cook", "how to bake", "how do i cook", "how do i bake",
    "movie", "movies", "netflix", "tv show", "tv series", "song", "songs", "lyrics",
    "playlist", "spotify", "youtube video",
    "football", "soccer", "nba", "nfl", "super bowl", "world cup", "premier league",
    "baseball", "basketball", "horoscope", "astrology", "zodiac", "sports scores",
    "sports news", "the game last night",
    "tell me a joke", "a joke", "jokes", "write a poem", "poem", "write a story",
    "write an essay", "essay", "homework",
    "capital of", "president of", "the president", "prime minister", "who won", "celebrity",
    "meaning of existence", "why do we exist", "what is consciousness", "quantum physics",
    "quantum mechanics", "explain quantum", "philosophy", "write code for", "write some code",
    "write a program", "help me with homework", "what do you think about me",
    "what do you think of me", "how are you feeling", "are you happy", "are you sad",
    "dating", "girlfriend", "boyfriend", "video game", "video games", "fortnite",
    "minecraft", "lottery", "casino", "gambling",
    "pizza recipe", "burger", "restaurant", "hotel booking", "book a flight", "vacation",
    "pasta", "cookies", "baking", "steak", "recipe for",
    "meaning of life", "chatgpt", "openai",
    "celsius to fahrenheit", "fahrenheit to celsius", "miles to km", "km to miles",
    "kg to lbs", "lbs to kg", "pounds to kg", "inches to cm", "cm to inches",
    "how many cups", "how many ounces", "convert miles", "convert currency",
    "exchange rate", "miles to kilometers", "kilometers to miles", "miles to kilometres",
    "gallons to liters", "liters to gallons", "liters in a gallon", "litres in a gallon",
    "gallons in a liter", "feet to meters", "meters to feet",
    "% tip", "tip on the bill", "calculate tax", "% discount",
};

// Geography questions: one of these openers plus a place name.
constexpr const char* kPlaceQuestions[] = {
    "where is", "wheres", "where are", "how far is", "how far", "distance from",
    "temperature in", "weather in", "time in", "whats the time in", "what time is it in",
    "flights to", "how do i get to", "population of",
};

constexpr const char* kPlaceNames[] = {
    "australia", "france", "japan", "china", "india", "italy", "spain", "germany",
    "england", "brazil", "canada", "mexico", "russia", "america", "usa", "europe",
    "africa", "asia", "paris", "london", "tokyo", "new york", "rome", "madrid",
    "berlin", "sydney", "monaco", "dubai", "miami", "los angeles",
};

constexpr const char* kNonDomainOpeners[] = {
    "translate", "who was", "who is the president", "tell me the news", "tell me about news", "how old is", "what year was", "what is the capital",
    "whats the capital", "what is the meaning", "tell me about yourself", "tell me a",
    "sing", "play some", "play music", "what time is it", "recommend a movie",
    "recommend a book", "recommend a restaurant", "whats the weather", "what is the weather",
    "hows the weather", "how is the weather", "will it rain", "is it going to rain",
    "write me a", "can you write a poem", "solve this equation",
    "recommend a song", "explain consciousness",
};

constexpr const char* kChitChat[] = {
    "hi", "hello", "hey", "hey there", "hi there", "yo", "sup", "whats up", "wassup",
    "how are you", "how are you doing", "how are you today", "hows it going",
    "how is it going", "good morning", "good afternoon", "good evening", "good night",
    "goodnight", "thank you", "thanks", "thanks a lot", "ok", "okay", "lol", "haha",
    "bye", "goodbye", "see you", "who are you", "what are you", "what can you do",
    "are you human", "are you a robot", "are you a bot", "are you real", "i love you",
    "whats your name", "what is your name", "nice to meet you", "test", "testing",
    "what do you think",
};

// Clauses that only greet or thank; never a topic change on their own.
constexpr const char* kGreetingClauses[] = {
    "hi", "hello", "hey", "hey there", "hi there", "yo", "morning", "good morning",
    "good afternoon", "good evening", "good day", "evening", "thanks", "thank you",
    "thanks a lot", "thanks so much", "thank you so much", "thank you very much",
    "many thanks", "thanks mate", "cheers", "ta", "appreciate it", "much appreciated",
    "ok", "okay", "ok thanks", "okay thanks",
};

// ── Politeness ──────────────────────────────────────────────────────────

constexpr const char* kPolitePrefixes[] = {
    "please", "pls", "plz", "kindly", "hi", "hello", "hey", "hey there", "hi there",
    "ok", "okay", "so", "um", "uh", "hmm", "quickly", "just", "go ahead and",
    "lets", "let us",
    "can you", "could you", "would you", "will you", "can u", "could u",
    "can you please", "could you please", "would you please", "will you please",
    "please can you", "please could you", "please would you",
    "hey can you", "hi can you", "hey could you", "hi could you", "hello can you",
    "i need you to", "id like you to", "i would like you to", "i want you to",
    "i want to", "id like to", "i would like to", "i need to", "we need to",
    "i was wondering if you could", "i was wondering if maybe you could",
    "i was wondering if maybe you could possibly", "could you possibly",
    "would you mind", "do you mind", "can you help me", "could you help me",
    "help me", "please help me",
};

constexpr const char* kPoliteSuffixes[] = {
    "please", "pls", "plz", "thanks", "thank you", "thx", "ty", "cheers", "mate",
    "if you can", "if you could", "if possible", "when you can", "when you get a chance",
    "would you mind", "for me", "for me please", "for me thanks", "asap",
    "please thanks", "thanks in advance", "thank you very much", "much appreciated",
};

constexpr const char* kClauseConjunctions[] = {
    "and", "also", "then", "plus", "btw", "by the way", "but", "and then", "and also",
    "but also", "after that", "oh and", "oh also",
};

// ── Lane cascade ────────────────────────────────────────────────────────

constexpr const char* kBareAbbreviations[] = {
    "wm", "dg", "stp", "ac", "a/c", "gen", "genset", "hyd", "elec", "nav", "aux",
};

constexpr const char* kWorkOrderFragments[] = {
    "new wo", "new work order", "wo for", "wo on", "wo re", "work order for",
    "work order on", "new task", "task for", "new defect", "defect on", "defect for",
    "new job", "job for", "new note", "note for", "note on", "handover note",
    "new fault report",
};

constexpr const char* kHoursWords[] = {
    "hours", "hrs", "hr", "running hours", "run hours", "engine hours",
};

constexpr const char* kCompletedWork[] = {
    "replaced", "changed", "swapped", "swapped out", "topped up", "fixed", "repaired",
    "cleaned", "serviced", "finished", "done with", "installed", "fitted", "greased",
    "renewed", "overhauled", "rebuilt", "flushed", "tightened", "adjusted", "inspected",
    "just replaced", "just changed", "just finished", "just serviced", "just did",
    "just fixed", "just cleaned", "just installed",
    "i replaced", "we replaced", "i changed", "we changed", "i serviced", "we serviced",
    "i fixed", "we fixed", "i finished", "we finished", "i installed", "we installed",
    "i cleaned", "we cleaned", "i topped up", "we topped up", "i did", "we did",
    "have replaced", "have changed", "have serviced", "have fixed", "weve replaced",
    "ive replaced", "ive changed", "ive serviced", "ive fixed",
};

constexpr const char* kStockDepletion[] = {
    "ran out of", "run out of", "running out of", "were out of", "we are out of",
    "out of spare", "used the last", "used last", "used up", "need more", "running low on",
    "low on", "almost out of", "none left", "no more", "last one", "need new",
    "need a new", "need another",
};

constexpr const char* kReadingPhrases[] = {
    "hours are", "hours is", "hours now", "hours at", "hour meter", "hour meter at",
    "reading is", "reading of", "reads", "is reading", "now at", "currently at",
    "is at", "are at", "shows", "showing", "measured", "logged at",
};

constexpr const char* kCommandVerbs[] = {
    "create", "add", "log", "record", "mark", "schedule", "assign", "update", "close",
    "complete", "order", "export", "upload", "attach", "acknowledge", "ack", "approve",
    "raise", "reorder", "submit", "delete", "remove", "edit", "modify", "set", "change",
    "report", "book", "request", "sign off", "note", "register", "file", "cancel",
    "reassign", "reschedule", "defer", "generate", "print", "email", "send", "transfer",
    "archive", "restock", "write up", "put in", "make a", "make new", "start a",
    "open a", "open new", "open up a", "log a", "add a", "create a",
};

constexpr const char* kMutationVerbs[] = {
    "create", "add", "update", "delete", "remove", "mark", "assign", "close", "complete",
    "reorder", "raise", "export", "upload", "attach", "approve", "acknowledge", "edit",
    "modify", "cancel", "submit", "reassign", "reschedule", "defer", "archive", "restock",
};

constexpr const char* kLookupLeads[] = {
    "show", "show me", "find", "find me", "where is", "where are", "wheres", "view",
    "search", "search for", "look up", "lookup", "list", "get", "get me", "give me",
    "display", "locate", "check", "how many", "do we have", "pull up", "bring up",
    "status of", "status", "what is the status of", "whats the status of",
    "what is", "whats", "what are", "which", "when is", "when was", "when did",
    "how much", "is there", "are there", "any", "who is assigned to",
};

constexpr const char* kListFilters[] = {
    "pending work orders", "pending tasks", "pending wos", "open work orders", "open wos",
    "open tasks", "open faults", "open defects", "overdue work orders", "overdue tasks",
    "overdue maintenance", "overdue service", "completed work orders", "closed work orders",
    "in progress", "out of stock", "low stock", "in stock", "below minimum",
    "active faults", "active alarms", "unresolved faults", "critical faults",
    "critical work orders", "high priority", "due this week", "due today", "due soon",
    "due next week", "upcoming maintenance", "upcoming service", "scheduled maintenance",
    "expiring certificates", "expired certificates", "all work orders", "all faults",
    "all equipment", "my tasks", "my work orders",
};

constexpr const char* kProblemVocabulary[] = {
    "overheating", "overheat", "overheated", "leaking", "leak", "leaks", "vibration",
    "vibrating", "vibrates", "noise", "noisy", "knocking", "grinding", "squealing",
    "rattling", "smoke", "smoking", "not starting", "wont start", "doesnt start",
    "not working", "wont work", "doesnt work", "broken", "failed", "failure", "failing",
    "tripping", "tripped", "keeps tripping", "cutting out", "cuts out", "stalling",
    "stalled", "surging", "hunting", "low pressure", "high pressure", "low voltage",
    "high voltage", "high temperature", "high temp", "low oil pressure", "pressure drop",
    "dropping", "lost power", "loss of", "no power", "no water", "no flow", "clogged",
    "seized", "stuck", "corroded", "corrosion", "cracked", "burning smell", "smells",
    "erratic", "fluctuating", "unstable", "shutting down", "shut down unexpectedly",
    "problem", "problems", "issue", "issues", "trouble", "wrong", "strange", "weird",
    "abnormal", "unusual", "alarm going off", "alarming",
};

constexpr const char* kTemporalContext[] = {
    "again", "keeps", "keep happening", "still", "since yesterday", "since last",
    "since the", "since we", "after the", "after we", "after service", "after replacing",
    "every time", "each time", "whenever", "recently", "lately", "suddenly", "sometimes",
    "intermittently", "intermittent", "on and off", "for the past", "for days",
    "for weeks", "last night", "yesterday", "this morning", "earlier today",
    "happening again", "happened before", "getting worse", "worse",
};

constexpr const char* kDiagnosisIntent[] = {
    "why", "whats causing", "what is causing", "what causes", "what caused", "cause of",
    "root cause", "diagnose", "diagnosis", "troubleshoot", "troubleshooting",
    "how do i fix", "how to fix", "how can i fix", "how do we fix", "fix",
    "what should i do", "what should i check", "what does it mean", "what does this mean",
    "explain", "help with", "advice", "should i", "is it safe", "is it normal",
    "is this normal", "could it be", "possible causes", "likely cause",
};

// Record nouns that mark a query as being about the domain; every entity
// vocabulary phrase counts as well.
constexpr const char* kRecordNouns[] = {
    "work order", "work orders", "wo", "wos", "task", "tasks", "job", "jobs", "defect",
    "defects", "fault", "faults", "alarm", "alarms", "note", "notes", "handover",
    "report", "reports", "inventory", "stock", "spares", "spare", "spare parts",
    "parts", "part", "purchase order", "purchase orders", "po", "hours", "running hours",
    "maintenance", "service", "servicing", "certificate", "certificates", "document",
    "documents", "manual", "manuals", "checklist", "checklists", "logbook", "log",
    "history", "schedule", "crew", "vessel", "boat", "yacht", "ship", "equipment",
    "system", "systems", "oil", "coolant", "spec", "specs", "specification", "warranty",
    "supplier", "invoice", "drawing", "diagram", "procedure",
};

// ── Entity dictionary ───────────────────────────────────────────────────

struct VocabularyPhrase {
    const char* phrase;
    EntityType type;
    float confidence;
};

constexpr VocabularyPhrase kVocabulary[] = {
    // Equipment
    {"main engine",            EntityType::Equipment, 0.90f},
    {"main engines",           EntityType::Equipment, 0.90f},
    {"port engine",            EntityType::Equipment, 0.90f},
    {"starboard engine",       EntityType::Equipment, 0.90f},
    {"stbd engine",            EntityType::Equipment, 0.90f},
    {"generator",              EntityType::Equipment, 0.90f},
    {"generators",             EntityType::Equipment, 0.90f},
    {"genset",                 EntityType::Equipment, 0.90f},
    {"gen set",                EntityType::Equipment, 0.90f},
    {"gen",                    EntityType::Equipment, 0.85f},
    {"dg",                     EntityType::Equipment, 0.85f},
    {"diesel generator",       EntityType::Equipment, 0.90f},
    {"emergency generator",    EntityType::Equipment, 0.90f},
    {"watermaker",             EntityType::Equipment, 0.90f},
    {"water maker",            EntityType::Equipment, 0.90f},
    {"desalinator",            EntityType::Equipment, 0.90f},
    {"wm",                     EntityType::Equipment, 0.85f},
    {"hvac",                   EntityType::Equipment, 0.90f},
    {"air conditioning",       EntityType::Equipment, 0.90f},
    {"a/c",                    EntityType::Equipment, 0.85f},
    {"ac",                     EntityType::Equipment, 0.85f},
    {"ac unit",                EntityType::Equipment, 0.90f},
    {"chiller",                EntityType::Equipment, 0.90f},
    {"bilge pump",             EntityType::Equipment, 0.90f},
    {"bilge",                  EntityType::Equipment, 0.90f},
    {"fire pump",              EntityType::Equipment, 0.90f},
    {"fuel pump",              EntityType::Equipment, 0.90f},
    {"sea water pump",         EntityType::Equipment, 0.90f},
    {"seawater pump",          EntityType::Equipment, 0.90f},
    {"raw water pump",         EntityType::Equipment, 0.90f},
    {"fresh water pump",       EntityType::Equipment, 0.90f},
    {"freshwater pump",        EntityType::Equipment, 0.90f},
    {"transfer pump",          EntityType::Equipment, 0.90f},
    {"hydraulic pump",         EntityType::Equipment, 0.90f},
    {"steering pump",          EntityType::Equipment, 0.90f},
    {"bow thruster",           EntityType::Equipment, 0.90f},
    {"stern thruster",         EntityType::Equipment, 0.90f},
    {"thruster",               EntityType::Equipment, 0.90f},
    {"stabilizer",             EntityType::Equipment, 0.90f},
    {"stabilizers",            EntityType::Equipment, 0.90f},
    {"windlass",               EntityType::Equipment, 0.90f},
    {"anchor windlass",        EntityType::Equipment, 0.90f},
    {"capstan",                EntityType::Equipment, 0.90f},
    {"davit",                  EntityType::Equipment, 0.90f},
    {"crane",                  EntityType::Equipment, 0.90f},
    {"tender",                 EntityType::Equipment, 0.85f},
    {"compressor",             EntityType::Equipment, 0.90f},
    {"air compressor",         EntityType::Equipment, 0.90f},
    {"sewage treatment plant", EntityType::Equipment, 0.90f},
    {"stp",                    EntityType::Equipment, 0.85f},
    {"incinerator",            EntityType::Equipment, 0.90f},
    {"boiler",                 EntityType::Equipment, 0.90f},
    {"heat exchanger",         EntityType::Equipment, 0.90f},
    {"intercooler",            EntityType::Equipment, 0.90f},
    {"turbocharger",           EntityType::Equipment, 0.90f},
    {"turbo",                  EntityType::Equipment, 0.85f},
    {"battery charger",        EntityType::Equipment, 0.90f},
    {"inverter",               EntityType::Equipment, 0.90f},
    {"radar",                  EntityType::Equipment, 0.90f},
    {"autopilot",              EntityType::Equipment, 0.90f},
    {"gps",                    EntityType::Equipment, 0.90f},
    {"chartplotter",           EntityType::Equipment, 0.90f},
    {"vhf",                    EntityType::Equipment, 0.90f},
    {"ais",                    EntityType::Equipment, 0.90f},
    {"echo sounder",           EntityType::Equipment, 0.90f},
    {"gyro",                   EntityType::Equipment, 0.85f},
    {"gyrocompass",            EntityType::Equipment, 0.90f},
    {"epirb",                  EntityType::Equipment, 0.90f},
    {"life raft",              EntityType::Equipment, 0.90f},
    {"liferaft",               EntityType::Equipment, 0.90f},
    {"steering gear",          EntityType::Equipment, 0.90f},
    {"rudder",                 EntityType::Equipment, 0.90f},
    {"propeller",              EntityType::Equipment, 0.90f},
    {"shaft seal",             EntityType::Equipment, 0.90f},
    {"stern tube",             EntityType::Equipment, 0.90f},
    {"gearbox",                EntityType::Equipment, 0.90f},
    {"reduction gear",         EntityType::Equipment, 0.90f},
    {"alternator",             EntityType::Equipment, 0.90f},
    {"starter motor",          EntityType::Equipment, 0.90f},
    {"aux engine",             EntityType::Equipment, 0.90f},
    {"auxiliary engine",       EntityType::Equipment, 0.90f},
    {"outboard",               EntityType::Equipment, 0.90f},
    {"ice maker",              EntityType::Equipment, 0.90f},
    {"refrigerator",           EntityType::Equipment, 0.90f},
    {"freezer",                EntityType::Equipment, 0.90f},
    {"washing machine",        EntityType::Equipment, 0.90f},
    {"oily water separator",   EntityType::Equipment, 0.90f},
    {"fuel purifier",          EntityType::Equipment, 0.90f},
    {"purifier",               EntityType::Equipment, 0.90f},
    {"pump",                   EntityType::Equipment, 0.70f},
    {"engine",                 EntityType::Equipment, 0.70f},
    {"motor",                  EntityType::Equipment, 0.70f},
    {"tank",                   EntityType::Equipment, 0.70f},

    // Systems
    {"hydraulic system",       EntityType::System, 0.85f},
    {"hydraulics",             EntityType::System, 0.85f},
    {"hydraulic",              EntityType::System, 0.85f},
    {"hyd",                    EntityType::System, 0.85f},
    {"electrical system",      EntityType::System, 0.85f},
    {"electrical",             EntityType::System, 0.85f},
    {"electrics",              EntityType::System, 0.85f},
    {"elec",                   EntityType::System, 0.85f},
    {"fuel system",            EntityType::System, 0.85f},
    {"fuel",                   EntityType::System, 0.85f},
    {"cooling system",         EntityType::System, 0.85f},
    {"cooling",                EntityType::System, 0.85f},
    {"coolant system",         EntityType::System, 0.85f},
    {"lube oil system",        EntityType::System, 0.85f},
    {"lubrication",            EntityType::System, 0.85f},
    {"exhaust system",         EntityType::System, 0.85f},
    {"exhaust",                EntityType::System, 0.85f},
    {"navigation system",      EntityType::System, 0.85f},
    {"navigation",             EntityType::System, 0.85f},
    {"nav",                    EntityType::System, 0.85f},
    {"propulsion",             EntityType::System, 0.85f},
    {"steering system",        EntityType::System, 0.85f},
    {"fresh water system",     EntityType::System, 0.85f},
    {"fire suppression",       EntityType::System, 0.85f},
    {"fire suppression system", EntityType::System, 0.85f},
    {"bilge system",           EntityType::System, 0.85f},
    {"sewage system",          EntityType::System, 0.85f},
    {"ventilation",            EntityType::System, 0.85f},
    {"shore power",            EntityType::System, 0.85f},

    // Parts
    {"oil filter",             EntityType::Part, 0.85f},
    {"fuel filter",            EntityType::Part, 0.85f},
    {"air filter",             EntityType::Part, 0.85f},
    {"racor",                  EntityType::Part, 0.85f},
    {"racor filter",           EntityType::Part, 0.85f},
    {"filter",                 EntityType::Part, 0.80f},
    {"filters",                EntityType::Part, 0.80f},
    {"impeller",               EntityType::Part, 0.85f},
    {"impellers",              EntityType::Part, 0.85f},
    {"belt",                   EntityType::Part, 0.80f},
    {"v-belt",                 EntityType::Part, 0.85f},
    {"drive belt",             EntityType::Part, 0.85f},
    {"gasket",                 EntityType::Part, 0.85f},
    {"seal",                   EntityType::Part, 0.80f},
    {"o-ring",                 EntityType::Part, 0.85f},
    {"o ring",                 EntityType::Part, 0.85f},
    {"bearing",                EntityType::Part, 0.85f},
    {"bearings",               EntityType::Part, 0.85f},
    {"anode",                  EntityType::Part, 0.85f},
    {"anodes",                 EntityType::Part, 0.85f},
    {"zinc",                   EntityType::Part, 0.85f},
    {"zincs",                  EntityType::Part, 0.85f},
    {"injector",               EntityType::Part, 0.85f},
    {"injectors",              EntityType::Part, 0.85f},
    {"glow plug",              EntityType::Part, 0.85f},
    {"thermostat",             EntityType::Part, 0.85f},
    {"hose",                   EntityType::Part, 0.80f},
    {"hoses",                  EntityType::Part, 0.80f},
    {"coupling",               EntityType::Part, 0.85f},
    {"membrane",               EntityType::Part, 0.85f},
    {"membranes",              EntityType::Part, 0.85f},
    {"strainer",               EntityType::Part, 0.85f},
    {"sea strainer",           EntityType::Part, 0.85f},
    {"relay",                  EntityType::Part, 0.85f},
    {"fuse",                   EntityType::Part, 0.85f},
    {"fuses",                  EntityType::Part, 0.85f},
    {"circuit breaker",        EntityType::Part, 0.85f},
    {"sensor",                 EntityType::Part, 0.80f},
    {"pressure sensor",        EntityType::Part, 0.85f},
    {"temperature sensor",     EntityType::Part, 0.85f},
    {"solenoid",               EntityType::Part, 0.85f},
    {"valve",                  EntityType::Part, 0.75f},
    {"bypass valve",           EntityType::Part, 0.85f},

    // Maritime terms and symptoms
    {"overheating",            EntityType::MaritimeTerm, 0.75f},
    {"overheat",               EntityType::MaritimeTerm, 0.75f},
    {"overheated",             EntityType::MaritimeTerm, 0.75f},
    {"leak",                   EntityType::MaritimeTerm, 0.75f},
    {"leaking",                EntityType::MaritimeTerm, 0.75f},
    {"vibration",              EntityType::MaritimeTerm, 0.75f},
    {"noise",                  EntityType::MaritimeTerm, 0.70f},
    {"smoke",                  EntityType::MaritimeTerm, 0.75f},
    {"alarm",                  EntityType::MaritimeTerm, 0.70f},
    {"fault",                  EntityType::MaritimeTerm, 0.70f},
    {"trip",                   EntityType::MaritimeTerm, 0.70f},
    {"tripped",                EntityType::MaritimeTerm, 0.75f},
    {"low pressure",           EntityType::MaritimeTerm, 0.75f},
    {"high pressure",          EntityType::MaritimeTerm, 0.75f},
    {"oil pressure",           EntityType::MaritimeTerm, 0.75f},
    {"oil temperature",        EntityType::MaritimeTerm, 0.75f},
    {"coolant temperature",    EntityType::MaritimeTerm, 0.75f},
    {"exhaust temperature",    EntityType::MaritimeTerm, 0.75f},
    {"water in fuel",          EntityType::MaritimeTerm, 0.75f},
    {"cavitation",             EntityType::MaritimeTerm, 0.75f},
    {"corrosion",              EntityType::MaritimeTerm, 0.75f},
    {"running hours",          EntityType::MaritimeTerm, 0.75f},
    {"oil change",             EntityType::MaritimeTerm, 0.75f},
    {"service interval",       EntityType::MaritimeTerm, 0.75f},
    {"starboard",              EntityType::MaritimeTerm, 0.75f},
    {"stbd",                   EntityType::MaritimeTerm, 0.75f},
    {"port side",              EntityType::MaritimeTerm, 0.75f},
    {"portside",               EntityType::MaritimeTerm, 0.75f},
    {"forward",                EntityType::MaritimeTerm, 0.70f},
    {"fwd",                    EntityType::MaritimeTerm, 0.75f},
    {"aft",                    EntityType::MaritimeTerm, 0.75f},
    {"bow",                    EntityType::MaritimeTerm, 0.75f},
    {"stern",                  EntityType::MaritimeTerm, 0.75f},
    {"hull",                   EntityType::MaritimeTerm, 0.75f},
    {"bilge water",            EntityType::MaritimeTerm, 0.75f},
    {"keel",                   EntityType::MaritimeTerm, 0.75f},
    {"engine room",            EntityType::MaritimeTerm, 0.75f},
    {"lazarette",              EntityType::MaritimeTerm, 0.75f},
    {"flybridge",              EntityType::MaritimeTerm, 0.75f},
    {"wheelhouse",             EntityType::MaritimeTerm, 0.75f},
    {"galley",                 EntityType::MaritimeTerm, 0.75f},
    {"sea trial",              EntityType::MaritimeTerm, 0.75f},
    {"dry dock",               EntityType::MaritimeTerm, 0.75f},
    {"haul out",               EntityType::MaritimeTerm, 0.75f},
    {"antifouling",            EntityType::MaritimeTerm, 0.75f},
};

struct CanonicalAlias {
    const char* key;
    const char* canonical;
};

// Each canonical value, read back as a key, maps to itself.
constexpr CanonicalAlias kAliases[] = {
    {"main engine",            "MAIN_ENGINE"},
    {"main engines",           "MAIN_ENGINE"},
    {"port engine",            "MAIN_ENGINE_PORT"},
    {"starboard engine",       "MAIN_ENGINE_STBD"},
    {"stbd engine",            "MAIN_ENGINE_STBD"},
    {"generator",              "GENERATOR"},
    {"generators",             "GENERATOR"},
    {"genset",                 "GENERATOR"},
    {"gen set",                "GENERATOR"},
    {"gen",                    "GENERATOR"},
    {"dg",                     "GENERATOR"},
    {"diesel generator",       "GENERATOR"},
    {"emergency generator",    "EMERGENCY_GENERATOR"},
    {"watermaker",             "WATERMAKER"},
    {"water maker",            "WATERMAKER"},
    {"desalinator",            "WATERMAKER"},
    {"wm",                     "WATERMAKER"},
    {"hvac",                   "HVAC"},
    {"air conditioning",       "HVAC"},
    {"a/c",                    "HVAC"},
    {"ac",                     "HVAC"},
    {"ac unit",                "HVAC"},
    {"bilge",                  "BILGE_PUMP"},
    {"bilge pump",             "BILGE_PUMP"},
    {"sea water pump",         "SEAWATER_PUMP"},
    {"seawater pump",          "SEAWATER_PUMP"},
    {"raw water pump",         "SEAWATER_PUMP"},
    {"fresh water pump",       "FRESHWATER_PUMP"},
    {"freshwater pump",        "FRESHWATER_PUMP"},
    {"stp",                    "SEWAGE_TREATMENT_PLANT"},
    {"sewage treatment plant", "SEWAGE_TREATMENT_PLANT"},
    {"anchor windlass",        "WINDLASS"},
    {"stabilizers",            "STABILIZER"},
    {"air compressor",         "COMPRESSOR"},
    {"turbo",                  "TURBOCHARGER"},
    {"gyro",                   "GYROCOMPASS"},
    {"liferaft",               "LIFE_RAFT"},
    {"life raft",              "LIFE_RAFT"},
    {"aux engine",             "AUX_ENGINE"},
    {"auxiliary engine",       "AUX_ENGINE"},
    {"fuel purifier",          "PURIFIER"},

    {"hydraulic system",       "HYDRAULIC_SYSTEM"},
    {"hydraulics",             "HYDRAULIC_SYSTEM"},
    {"hydraulic",              "HYDRAULIC_SYSTEM"},
    {"hyd",                    "HYDRAULIC_SYSTEM"},
    {"electrical system",      "ELECTRICAL_SYSTEM"},
    {"electrical",             "ELECTRICAL_SYSTEM"},
    {"electrics",              "ELECTRICAL_SYSTEM"},
    {"elec",                   "ELECTRICAL_SYSTEM"},
    {"fuel system",            "FUEL_SYSTEM"},
    {"fuel",                   "FUEL_SYSTEM"},
    {"cooling system",         "COOLING_SYSTEM"},
    {"cooling",                "COOLING_SYSTEM"},
    {"coolant system",         "COOLING_SYSTEM"},
    {"lube oil system",        "LUBE_OIL_SYSTEM"},
    {"lubrication",            "LUBE_OIL_SYSTEM"},
    {"exhaust system",         "EXHAUST_SYSTEM"},
    {"exhaust",                "EXHAUST_SYSTEM"},
    {"navigation system",      "NAVIGATION_SYSTEM"},
    {"navigation",             "NAVIGATION_SYSTEM"},
    {"nav",                    "NAVIGATION_SYSTEM"},
    {"propulsion",             "PROPULSION_SYSTEM"},
    {"propulsion system",      "PROPULSION_SYSTEM"},
    {"fire suppression",       "FIRE_SUPPRESSION_SYSTEM"},
    {"fire suppression system", "FIRE_SUPPRESSION_SYSTEM"},

    {"filters",                "FILTER"},
    {"impellers",              "IMPELLER"},
    {"v-belt",                 "V_BELT"},
    {"o-ring",                 "O_RING"},
    {"o ring",                 "O_RING"},
    {"bearings",               "BEARING"},
    {"anodes",                 "ANODE"},
    {"zinc",                   "ANODE"},
    {"zincs",                  "ANODE"},
    {"injectors",              "INJECTOR"},
    {"hoses",                  "HOSE"},
    {"membranes",              "MEMBRANE"},
    {"fuses",                  "FUSE"},
    {"racor",                  "RACOR_FILTER"},

    {"overheat",               "OVERHEATING"},
    {"overheated",             "OVERHEATING"},
    {"leaking",                "LEAK"},
    {"tripped",                "TRIP"},
    {"stbd",                   "STARBOARD"},
    {"fwd",                    "FORWARD"},
    {"port side",              "PORT"},
    {"portside",               "PORT"},
};

template <size_t N>
std::vector<PhraseRule> rulesFrom(const char* const (&phrases)[N], PhraseAnchor anchor,
                                  bool wordBoundary = true, int id = 0)
{
    std::vector<PhraseRule> rules;
    rules.reserve(N);
    for (const char* phrase : phrases) {
        PhraseRule rule;
        rule.phrase = QString::fromUtf8(phrase);
        rule.id = id;
        rule.anchor = anchor;
        rule.wordBoundary = wordBoundary;
        rules.push_back(rule);
    }
    return rules;
}

template <size_t N>
void append(std::vector<PhraseRule>& rules, const char* const (&phrases)[N], PhraseAnchor anchor,
            bool wordBoundary = true, int id = 0)
{
    std::vector<PhraseRule> more = rulesFrom(phrases, anchor, wordBoundary, id);
    rules.insert(rules.end(), more.begin(), more.end());
}

} // namespace

const PatternTables& PatternTables::instance()
{
    static const PatternTables kTables;
    return kTables;
}

PatternTables::PatternTables()
{
    std::vector<PhraseRule> injection = rulesFrom(kInjectionSymbols, PhraseAnchor::Anywhere, false);
    append(injection, kStackedCommands, PhraseAnchor::Anywhere);
    append(injection, kInjectionWords, PhraseAnchor::Anywhere);
    append(injection, kRoleTags, PhraseAnchor::TextStart);
    // Comment terminator trailing a statement: "... --".
    injection.push_back(PhraseRule{QStringLiteral("--"), 0, PhraseAnchor::TextEnd, false});
    m_injection = PhraseMatcher(injection);

    std::vector<PhraseRule> nonDomain = rulesFrom(kNonDomainKeywords, PhraseAnchor::Anywhere);
    append(nonDomain, kNonDomainOpeners, PhraseAnchor::TextStart);
    append(nonDomain, kChitChat, PhraseAnchor::WholeText);
    // "check the weather" but not "check the weather deck drains".
    nonDomain.push_back(PhraseRule{QStringLiteral("the weather"), 0, PhraseAnchor::TextEnd, true});
    m_nonDomain = PhraseMatcher(nonDomain);
    m_placeQuestions = PhraseMatcher(rulesFrom(kPlaceQuestions, PhraseAnchor::TextStart));
    m_placeNames = PhraseMatcher(rulesFrom(kPlaceNames, PhraseAnchor::Anywhere));
    m_greetings = PhraseMatcher(rulesFrom(kGreetingClauses, PhraseAnchor::WholeText));

    m_paste = PhraseMatcher(rulesFrom(kPasteSignatures, PhraseAnchor::Anywhere, false));
    m_conjunctions = PhraseMatcher(rulesFrom(kClauseConjunctions, PhraseAnchor::Anywhere));

    m_politePrefixes = PhraseMatcher(rulesFrom(kPolitePrefixes, PhraseAnchor::TextStart));
    m_politeSuffixes = PhraseMatcher(rulesFrom(kPoliteSuffixes, PhraseAnchor::TextEnd));

    m_bareAbbreviations = PhraseMatcher(rulesFrom(kBareAbbreviations, PhraseAnchor::WholeText));
    m_workOrderFragments = PhraseMatcher(rulesFrom(kWorkOrderFragments, PhraseAnchor::TextStart));
    m_hoursWords = PhraseMatcher(rulesFrom(kHoursWords, PhraseAnchor::Anywhere));
    m_completedWork = PhraseMatcher(rulesFrom(kCompletedWork, PhraseAnchor::TextStart));
    m_stockDepletion = PhraseMatcher(rulesFrom(kStockDepletion, PhraseAnchor::Anywhere));
    m_readingPhrases = PhraseMatcher(rulesFrom(kReadingPhrases, PhraseAnchor::Anywhere));
    m_commandVerbs = PhraseMatcher(rulesFrom(kCommandVerbs, PhraseAnchor::TextStart));
    m_mutationVerbs = PhraseMatcher(rulesFrom(kMutationVerbs, PhraseAnchor::Anywhere));
    m_lookupLeads = PhraseMatcher(rulesFrom(kLookupLeads, PhraseAnchor::TextStart));
    m_listFilters = PhraseMatcher(rulesFrom(kListFilters, PhraseAnchor::Anywhere));
    m_problem = PhraseMatcher(rulesFrom(kProblemVocabulary, PhraseAnchor::Anywhere));
    m_temporal = PhraseMatcher(rulesFrom(kTemporalContext, PhraseAnchor::Anywhere));
    m_diagnosis = PhraseMatcher(rulesFrom(kDiagnosisIntent, PhraseAnchor::Anywhere));

    std::vector<PhraseRule> vocabulary;
    std::vector<PhraseRule> domainNouns = rulesFrom(kRecordNouns, PhraseAnchor::Anywhere);
    vocabulary.reserve(std::size(kVocabulary));
    m_entries.reserve(std::size(kVocabulary));
    for (const VocabularyPhrase& phrase : kVocabulary) {
        PhraseRule rule;
        rule.phrase = QString::fromUtf8(phrase.phrase);
        rule.id = static_cast<int>(m_entries.size());
        vocabulary.push_back(rule);
        domainNouns.push_back(rule);
        m_entries.push_back(VocabularyEntry{phrase.type, phrase.confidence});
    }
    m_vocabulary = PhraseMatcher(vocabulary);
    m_domainNouns = PhraseMatcher(domainNouns);

    for (const CanonicalAlias& alias : kAliases) {
        m_aliases.insert(QString::fromUtf8(alias.key), QString::fromUtf8(alias.canonical));
    }

    LOG_DEBUG(hqCore, "Pattern tables built: %d injection, %d non-domain, %d vocabulary phrases",
              m_injection.ruleCount(), m_nonDomain.ruleCount(), m_vocabulary.ruleCount());
}

const VocabularyEntry& PatternTables::vocabularyEntry(int id) const
{
    return m_entries.at(static_cast<size_t>(id));
}

std::optional<QString> PatternTables::canonicalAlias(const QString& key) const
{
    const auto it = m_aliases.constFind(key);
    if (it == m_aliases.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

} // namespace hq
