#pragma once

#include "action_info.hpp"
#include "settings.hpp"
#include "sokoban.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

enum class MessageKind : uint8_t {
    Info = 0,
    System,
    Warning,
    Success,
};

struct Message {
    std::string text;
    MessageKind kind = MessageKind::Info;

    // Consecutive duplicates are folded into one line with a counter.
    int repeat = 1;
};

enum class GameOutcome : uint8_t {
    Playing = 0,
    Won,
    Lost,
};

enum class PromptKind : uint8_t {
    None = 0,
    PlayAgain,
    ConfirmQuit,
};

// Won beats lost: a last push that covers the final goal wins even at 0 moves.
GameOutcome evaluateOutcome(const Sokoban& game);

// Text frontend over a Sokoban engine: turns actions and typed commands into
// engine calls, keeps a message log, and owns save-slot paths.
class Console {
public:
    Console(Sokoban& game, const Settings& settings, std::filesystem::path dataDir);

    void handleAction(Action a);

    // Extended command, with or without a leading ':' or '#'.
    // help | buy <item> | shop | save [path] | load [path] | slot [name] | reset | quit
    void runCommand(const std::string& line);

    bool quitRequested() const { return quit_; }
    PromptKind prompt() const { return prompt_; }
    GameOutcome outcome() const { return evaluateOutcome(game_); }

    const std::string& activeSlot() const { return activeSlot_; }
    void setActiveSlot(const std::string& slot);
    std::string savePath() const;

    bool saveGame(const std::string& path);
    bool loadGame(const std::string& path);

    // Board in level markers, a stats line, and (optionally) the shop.
    std::string drawBoard() const;
    std::string recentMessages(int count) const;

    const std::vector<Message>& messages() const { return msgs_; }
    void pushMsg(const std::string& s, MessageKind kind = MessageKind::Info);

    // Supplies the key list shown next to each action in help. Optional.
    void setKeyDescriber(std::function<std::string(Action)> fn) { describeKeys_ = std::move(fn); }

private:
    Sokoban& game_;
    Settings settings_;
    std::filesystem::path dataDir_;
    std::string activeSlot_;

    std::vector<Message> msgs_;
    PromptKind prompt_ = PromptKind::None;
    bool quit_ = false;

    std::function<std::string(Action)> describeKeys_;

    void move(Direction d);
    void buy(const ShopItem& item);
    void answerPrompt(bool yes);
    void checkOutcome();
    void showHelp();
    void showShop();
};
