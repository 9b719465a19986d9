#include "console.hpp"

#include "save_files.hpp"
#include "slot_utils.hpp"

#include <algorithm>
#include <sstream>

namespace {

const std::vector<std::string>& commandList() {
    // User-facing; also used for prefix matching.
    static const std::vector<std::string> cmds = {
        "help",
        "buy",
        "shop",
        "save",
        "load",
        "slot",
        "reset",
        "quit",
    };
    return cmds;
}

const ShopItem* shopItemForAction(Action a) {
    switch (a) {
        case Action::BuyStrength: return findShopItem("S");
        case Action::BuyMove:     return findShopItem("M");
        case Action::BuyFancy:    return findShopItem("F");
        default:                  return nullptr;
    }
}

} // namespace

GameOutcome evaluateOutcome(const Sokoban& game) {
    if (game.hasWon()) return GameOutcome::Won;
    if (game.movesRemaining() == 0) return GameOutcome::Lost;
    return GameOutcome::Playing;
}

Console::Console(Sokoban& game, const Settings& settings, std::filesystem::path dataDir)
    : game_(game), settings_(settings), dataDir_(std::move(dataDir)) {
    activeSlot_ = normalizeSlotName(settings_.defaultSlot);
}

void Console::pushMsg(const std::string& s, MessageKind kind) {
    if (!msgs_.empty()) {
        Message& last = msgs_.back();
        if (last.text == s && last.kind == kind) {
            if (last.repeat < 9999) ++last.repeat;
            return;
        }
    }

    // Keep some scrollback
    if (msgs_.size() > 400) {
        msgs_.erase(msgs_.begin(), msgs_.begin() + 100);
    }
    msgs_.push_back({s, kind, 1});
}

void Console::setActiveSlot(const std::string& slot) {
    activeSlot_ = normalizeSlotName(slot);
}

std::string Console::savePath() const {
    return savePathForSlot(dataDir_, activeSlot_).string();
}

void Console::handleAction(Action a) {
    if (a == Action::None) return;

    if (prompt_ != PromptKind::None) {
        if (a == Action::Confirm) {
            answerPrompt(true);
        } else if (a == Action::Cancel) {
            answerPrompt(false);
        } else if (a == Action::Quit) {
            quit_ = true;
        } else {
            pushMsg("PLEASE ANSWER Y OR N.", MessageKind::System);
        }
        return;
    }

    switch (a) {
        case Action::Up:
        case Action::Down:
        case Action::Left:
        case Action::Right:
            if (const auto d = actioninfo::moveDirection(a)) move(*d);
            break;
        case Action::BuyStrength:
        case Action::BuyMove:
        case Action::BuyFancy:
            if (const ShopItem* item = shopItemForAction(a)) buy(*item);
            break;
        case Action::Restart:
            game_.reset();
            pushMsg("LEVEL RESTARTED.", MessageKind::System);
            break;
        case Action::Save:
            saveGame(savePath());
            break;
        case Action::Load:
            loadGame(savePath());
            break;
        case Action::Help:
            showHelp();
            break;
        case Action::Quit:
            if (settings_.confirmQuit) {
                prompt_ = PromptKind::ConfirmQuit;
                pushMsg("REALLY QUIT? (Y/N)", MessageKind::System);
            } else {
                quit_ = true;
            }
            break;
        case Action::Confirm:
        case Action::Cancel:
        case Action::None:
            break;
    }
}

void Console::move(Direction d) {
    if (game_.movesRemaining() <= 0) {
        pushMsg("NO MOVES LEFT.", MessageKind::Warning);
        return;
    }

    const GridPos target = game_.playerPosition() + dirDelta(d);
    const Entity* before = game_.state().entityAt(target);
    const bool pickup = before && before->isCollectible();
    const EntityKind pickupKind = pickup ? before->kind : EntityKind::Crate;

    if (!game_.attemptMove(d)) {
        pushMsg(std::string("YOU CAN'T MOVE ") + dirName(d) + ".");
        return;
    }

    if (pickup) {
        if (pickupKind == EntityKind::Coin) {
            pushMsg("YOU PICK UP A COIN ($" + std::to_string(COIN_VALUE) + ").", MessageKind::Success);
        } else {
            pushMsg(std::string("YOU DRINK THE ") + entityDef(pickupKind).name + ".", MessageKind::Success);
        }
    }

    checkOutcome();
}

void Console::buy(const ShopItem& item) {
    if (!game_.attemptPurchase(item.id)) {
        pushMsg("NOT ENOUGH MONEY FOR " + toUpper(item.displayName) +
                " (NEED $" + std::to_string(item.price) + ").", MessageKind::Warning);
        return;
    }
    pushMsg("YOU BUY AND DRINK A " + toUpper(item.displayName) + ".", MessageKind::Success);
}

void Console::answerPrompt(bool yes) {
    const PromptKind p = prompt_;
    prompt_ = PromptKind::None;

    switch (p) {
        case PromptKind::PlayAgain:
            if (yes) {
                game_.reset();
                pushMsg("NEW GAME.", MessageKind::System);
            } else {
                quit_ = true;
            }
            break;
        case PromptKind::ConfirmQuit:
            if (yes) quit_ = true;
            break;
        case PromptKind::None:
            break;
    }
}

void Console::checkOutcome() {
    switch (outcome()) {
        case GameOutcome::Won:
            prompt_ = PromptKind::PlayAgain;
            pushMsg("YOU WON! PLAY AGAIN? (Y/N)", MessageKind::Success);
            break;
        case GameOutcome::Lost:
            prompt_ = PromptKind::PlayAgain;
            pushMsg("YOU LOSE! PLAY AGAIN? (Y/N)", MessageKind::Warning);
            break;
        case GameOutcome::Playing:
            break;
    }
}

bool Console::saveGame(const std::string& path) {
    std::string err;
    if (!writeTextFileAtomic(path, game_.serialize(), settings_.saveBackups, &err)) {
        pushMsg("FAILED TO SAVE (" + err + ").", MessageKind::Warning);
        return false;
    }
    pushMsg("GAME SAVED.", MessageKind::Success);
    return true;
}

bool Console::loadGame(const std::string& path) {
    std::string text;
    if (!readTextFile(path, text, nullptr)) {
        pushMsg("NO SAVE FILE FOUND.", MessageKind::Warning);
        return false;
    }

    CorruptSaveError cerr;
    if (!game_.loadSerialized(text, &cerr)) {
        pushMsg("SAVE FILE IS CORRUPTED: " + cerr.describe(), MessageKind::Warning);
        return false;
    }

    // The outcome is checked after the next move, not on load.
    prompt_ = PromptKind::None;
    pushMsg("GAME LOADED.", MessageKind::Success);
    return true;
}

void Console::showHelp() {
    pushMsg("CONTROLS:", MessageKind::System);
    for (const auto& info : actioninfo::kActionInfoTable) {
        std::string line = std::string("  ") + info.token;
        if (describeKeys_) {
            const std::string keys = describeKeys_(info.action);
            if (!keys.empty()) line += " [" + keys + "]";
        }
        line += " - ";
        line += info.desc;
        pushMsg(line, MessageKind::System);
    }

    std::string cmds = "COMMANDS (:NAME):";
    for (const auto& c : commandList()) cmds += " " + c;
    pushMsg(cmds, MessageKind::System);
}

void Console::showShop() {
    for (const auto& it : game_.shopItems()) {
        pushMsg("  [" + std::string(it.id) + "] " + toUpper(it.displayName) +
                ": $" + std::to_string(it.price), MessageKind::System);
    }
}

void Console::runCommand(const std::string& rawLine) {
    std::string line = trim(rawLine);
    if (!line.empty() && (line[0] == ':' || line[0] == '#')) {
        line = trim(line.substr(1));
    }

    const std::vector<std::string> toks = splitWS(line);
    if (toks.empty()) return;

    std::string cmdIn = toLower(toks[0]);
    if (cmdIn == "?" || cmdIn == "commands") cmdIn = "help";
    else if (cmdIn == "restart" || cmdIn == "newgame") cmdIn = "reset";
    else if (cmdIn == "exit") cmdIn = "quit";
    else if (cmdIn == "purchase") cmdIn = "buy";

    // Exact match first, else unique prefix match.
    std::vector<std::string> matches;
    for (const auto& c : commandList()) {
        if (c == cmdIn) {
            matches = {c};
            break;
        }
    }
    if (matches.empty()) {
        for (const auto& c : commandList()) {
            if (c.rfind(cmdIn, 0) == 0) matches.push_back(c);
        }
    }

    if (matches.empty()) {
        pushMsg("UNKNOWN COMMAND: " + cmdIn, MessageKind::Warning);
        return;
    }
    if (matches.size() > 1) {
        std::string msg = "AMBIGUOUS: " + cmdIn + " (";
        for (size_t i = 0; i < matches.size(); ++i) {
            msg += matches[i];
            if (i + 1 < matches.size()) msg += ", ";
        }
        msg += ")";
        pushMsg(msg, MessageKind::Warning);
        return;
    }

    const std::string& cmd = matches[0];

    // Everything after the command word, as typed (paths, item names).
    std::string rest;
    if (toks.size() > 1) {
        rest = trim(line.substr(line.find(toks[0]) + toks[0].size()));
    }

    if (cmd == "help") {
        showHelp();
    } else if (cmd == "shop") {
        showShop();
    } else if (cmd == "buy") {
        if (prompt_ != PromptKind::None) {
            pushMsg("PLEASE ANSWER Y OR N.", MessageKind::System);
            return;
        }
        const ShopItem* item = resolveShopItem(rest);
        if (!item) {
            pushMsg(rest.empty() ? "BUY WHAT? (S, M OR F)" : "NO SUCH ITEM: " + rest, MessageKind::Warning);
            return;
        }
        buy(*item);
    } else if (cmd == "save") {
        saveGame(rest.empty() ? savePath() : rest);
    } else if (cmd == "load") {
        loadGame(rest.empty() ? savePath() : rest);
    } else if (cmd == "slot") {
        if (!rest.empty()) setActiveSlot(rest);
        pushMsg("SLOT: " + (activeSlot_.empty() ? std::string("default") : activeSlot_) +
                " (" + savePath() + ")", MessageKind::System);
    } else if (cmd == "reset") {
        game_.reset();
        prompt_ = PromptKind::None;
        pushMsg("LEVEL RESTARTED.", MessageKind::System);
    } else if (cmd == "quit") {
        quit_ = true;
    }
}

std::string Console::drawBoard() const {
    std::ostringstream ss;
    ss << encodeGrid(game_.state(), GridMarkers::Level);
    ss << "MOVES " << game_.movesRemaining()
       << "  STRENGTH " << game_.playerStrength()
       << "  MONEY $" << game_.money() << '\n';

    if (settings_.showShop) {
        ss << "SHOP:";
        for (const auto& it : game_.shopItems()) {
            ss << "  [" << it.id << "] " << it.displayName << " $" << it.price;
        }
        ss << '\n';
    }
    return ss.str();
}

std::string Console::recentMessages(int count) const {
    std::ostringstream ss;
    const size_t n = msgs_.size();
    const size_t take = count <= 0 ? 0 : std::min(n, static_cast<size_t>(count));
    for (size_t i = n - take; i < n; ++i) {
        ss << msgs_[i].text;
        if (msgs_[i].repeat > 1) ss << " (x" << msgs_[i].repeat << ")";
        ss << '\n';
    }
    return ss.str();
}
