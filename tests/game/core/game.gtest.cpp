#include "core/game.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace othello::gtest {

//! Records every signal it receives.
class SignalRecorder : public IGameSignalListener {
public:
	void onGameEvent(GameSignal signal) override {
		signals.push_back(signal);
	}

	std::vector<GameSignal> signals;
};

//! Drops its subscription on the first signal it receives.
class OneShotListener : public IGameSignalListener {
public:
	explicit OneShotListener(Game& game) : m_game(game) {
	}

	void onGameEvent(GameSignal) override {
		++calls;
		m_game.unsubscribe(this);
	}

	unsigned calls{0};

private:
	Game& m_game;
};

static void playWipeout(Game& game) {
	const Coord moves[] = {{2u, 4u}, {2u, 3u}, {1u, 2u}, {1u, 5u}, {1u, 4u}, {2u, 5u}, {4u, 2u}, {1u, 3u}, {1u, 6u}};
	for (const auto c: moves) {
		game.processEvent(CellClickEvent{c});
	}
}

TEST(Game, StartsInStartingPosition) {
	Game game;

	EXPECT_EQ(game.currentPlayer(), Player::First);
	EXPECT_EQ(game.readScores(), std::make_pair(std::uint8_t{2}, std::uint8_t{2}));
	EXPECT_EQ(game.readCell(3u, 3u), CellState::First);
	EXPECT_EQ(game.readCell(3u, 4u), CellState::Second);
	EXPECT_FALSE(game.isGameOver());
}

TEST(Game, AcceptedMoveSignals) {
	Game game;
	SignalRecorder recorder;
	game.subscribe(&recorder, GS_BoardChange | GS_PlayerChange | GS_ScoreChange | GS_GameOver);

	game.processEvent(CellClickEvent{{2u, 4u}});

	const std::vector<GameSignal> expected{GS_BoardChange, GS_PlayerChange, GS_ScoreChange};
	EXPECT_EQ(recorder.signals, expected);
	EXPECT_EQ(game.currentPlayer(), Player::Second);
	EXPECT_EQ(game.readScores(), std::make_pair(std::uint8_t{4}, std::uint8_t{1}));

	game.unsubscribe(&recorder);
}

TEST(Game, RejectedMoveIsSilent) {
	Game game;
	SignalRecorder recorder;
	game.subscribe(&recorder, GS_BoardChange | GS_PlayerChange | GS_ScoreChange | GS_GameOver);

	const auto before = game.state();
	game.processEvent(CellClickEvent{{2u, 3u}});
	game.processEvent(CellClickEvent{{3u, 3u}});
	game.processEvent(CellClickEvent{{8u, 8u}});

	EXPECT_TRUE(recorder.signals.empty());
	EXPECT_EQ(game.state(), before);

	game.unsubscribe(&recorder);
}

TEST(Game, SignalMask) {
	Game game;
	SignalRecorder recorder;
	game.subscribe(&recorder, GS_PlayerChange);

	game.processEvent(CellClickEvent{{2u, 4u}});
	game.processEvent(PassEvent{});

	const std::vector<GameSignal> expected{GS_PlayerChange, GS_PlayerChange};
	EXPECT_EQ(recorder.signals, expected);

	game.unsubscribe(&recorder);
	game.processEvent(PassEvent{});
	EXPECT_EQ(recorder.signals.size(), 2u);
}

TEST(Game, Pass) {
	Game game;
	const auto before = game.state();

	game.processEvent(PassEvent{});
	EXPECT_EQ(game.currentPlayer(), Player::Second);
	EXPECT_EQ(game.state().board, before.board);
	EXPECT_EQ(game.readScores(), std::make_pair(std::uint8_t{2}, std::uint8_t{2}));

	// Second may now open the game.
	game.processEvent(CellClickEvent{{2u, 3u}});
	EXPECT_EQ(game.readCell(2u, 3u), CellState::Second);
	EXPECT_EQ(game.currentPlayer(), Player::First);
}

TEST(Game, Reset) {
	Game game;
	const auto initial = game.state();

	game.processEvent(CellClickEvent{{2u, 4u}});
	game.processEvent(ResetEvent{});
	EXPECT_EQ(game.state(), initial);

	game.processEvent(ResetEvent{});
	EXPECT_EQ(game.state(), initial);
}

TEST(Game, GameOverSignal) {
	Game game;
	SignalRecorder recorder;
	game.subscribe(&recorder, GS_GameOver);

	playWipeout(game);

	EXPECT_TRUE(game.isGameOver());
	ASSERT_EQ(recorder.signals.size(), 1u);
	EXPECT_EQ(recorder.signals.front(), GS_GameOver);

	game.unsubscribe(&recorder);
}

TEST(Game, RejectedClickAfterGameOverSignalsAgain) {
	Game game;
	SignalRecorder recorder;
	game.subscribe(&recorder, GS_BoardChange | GS_GameOver);

	playWipeout(game);
	ASSERT_EQ(recorder.signals.back(), GS_GameOver);
	const auto signalsBefore = recorder.signals.size();
	const auto over          = game.state();

	// No legal move for Second at a corner far from the pieces.
	game.processEvent(CellClickEvent{{7u, 7u}});

	EXPECT_EQ(game.state(), over);
	ASSERT_EQ(recorder.signals.size(), signalsBefore + 1u);
	EXPECT_EQ(recorder.signals.back(), GS_GameOver);

	game.unsubscribe(&recorder);
}

TEST(Game, RejectedClickDuringGameSignalsNothing) {
	Game game;
	SignalRecorder recorder;
	game.subscribe(&recorder, GS_GameOver);

	game.processEvent(CellClickEvent{{0u, 0u}});
	EXPECT_TRUE(recorder.signals.empty());

	game.unsubscribe(&recorder);
}

TEST(Game, ListenerUnsubscribesInCallback) {
	Game game;
	OneShotListener oneShot(game);
	SignalRecorder recorder;
	game.subscribe(&oneShot, GS_BoardChange | GS_PlayerChange | GS_ScoreChange);
	game.subscribe(&recorder, GS_BoardChange | GS_PlayerChange | GS_ScoreChange);

	game.processEvent(CellClickEvent{{2u, 4u}});
	EXPECT_EQ(oneShot.calls, 1u);
	EXPECT_EQ(recorder.signals.size(), 3u);

	game.processEvent(PassEvent{});
	EXPECT_EQ(oneShot.calls, 1u);
	EXPECT_EQ(recorder.signals.size(), 4u);

	game.unsubscribe(&recorder);
}

TEST(Game, InputAcceptedAfterGameOverByDefault) {
	Game game;
	playWipeout(game);
	ASSERT_TRUE(game.isGameOver());
	ASSERT_EQ(game.currentPlayer(), Player::Second);

	game.processEvent(PassEvent{});
	EXPECT_EQ(game.currentPlayer(), Player::First);
}

TEST(Game, FreezeOnGameOver) {
	Game game(GameConfig{.freezeOnGameOver = true});
	playWipeout(game);
	ASSERT_TRUE(game.isGameOver());

	const auto over = game.state();
	game.processEvent(PassEvent{});
	game.processEvent(CellClickEvent{{0u, 0u}});
	EXPECT_EQ(game.state(), over);

	// Reset always works.
	game.processEvent(ResetEvent{});
	EXPECT_FALSE(game.isGameOver());
	game.processEvent(PassEvent{});
	EXPECT_EQ(game.currentPlayer(), Player::Second);
}

} // namespace othello::gtest
