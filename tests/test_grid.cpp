#include <cassert>
#include <iostream>
#include "lifegrid.h"

// Set every cell listed in a row shorthand, starting at (row0, col0)
void setrows(lifegrid& grid, int row0, int col0, const char* rows) {
    int row = row0, col = col0;
    for (const char* p = rows; *p; p++) {
        if (*p == '/') {
            row++;
            col = col0;
            continue;
        }
        if (*p != '.') {
            int rc = grid.setcell(row, col, 1);
            assert(rc == 0);
        }
        col++;
    }
}

void test_new_grid_is_empty() {
    lifegrid grid(7, 4);
    assert(grid.getwidth() == 7);
    assert(grid.getheight() == 4);
    assert(grid.isEmpty());
    for (int row = 0; row < 4; row++)
        for (int col = 0; col < 7; col++)
            assert(grid.isalive(row, col) == 0);
    std::cout << "PASSED: test_new_grid_is_empty\n";
}

void test_empty_stays_empty() {
    int sizes[][2] = {{1, 1}, {1, 9}, {9, 1}, {3, 3}, {17, 11}};
    for (int i = 0; i < 5; i++) {
        lifegrid grid(sizes[i][0], sizes[i][1]);
        lifegrid next = grid.nextgeneration();
        assert(next.isEmpty());
        assert(next.getwidth() == sizes[i][0]);
        assert(next.getheight() == sizes[i][1]);
    }
    std::cout << "PASSED: test_empty_stays_empty\n";
}

void test_out_of_bounds() {
    lifegrid grid(5, 3);
    assert(grid.isalive(-1, 0) < 0);
    assert(grid.isalive(0, -1) < 0);
    assert(grid.isalive(3, 0) < 0);
    assert(grid.isalive(0, 5) < 0);
    assert(grid.isalive(2, 4) == 0);
    assert(grid.setcell(3, 0, 1) < 0);
    assert(grid.setcell(0, 5, 1) < 0);
    assert(grid.setcell(0, 0, 2) < 0);
    assert(grid.isEmpty());
    std::cout << "PASSED: test_out_of_bounds\n";
}

void test_nonpositive_size() {
    lifegrid grid(0, 5);
    assert(grid.getwidth() == 0 && grid.getheight() == 0);
    assert(grid.isalive(0, 0) < 0);
    lifegrid grid2(4, -2);
    assert(grid2.getwidth() == 0 && grid2.getheight() == 0);
    std::cout << "PASSED: test_nonpositive_size\n";
}

void test_population_tracking() {
    lifegrid grid(4, 4);
    grid.setcell(1, 1, 1);
    grid.setcell(1, 1, 1);
    grid.setcell(2, 3, 1);
    assert(grid.getPopulation() == 2);
    grid.setcell(1, 1, 0);
    assert(grid.getPopulation() == 1);
    grid.clearall();
    assert(grid.isEmpty());
    std::cout << "PASSED: test_population_tracking\n";
}

void test_neighbor_count() {
    lifegrid grid(3, 3);
    setrows(grid, 0, 0, "XXX/XXX/XXX");
    assert(grid.liveneighbors(1, 1) == 8);
    // corners see only 3 neighbors: nothing wraps around
    assert(grid.liveneighbors(0, 0) == 3);
    assert(grid.liveneighbors(2, 2) == 3);
    assert(grid.liveneighbors(0, 1) == 5);
    // a position just outside counts the edge cells next to it
    assert(grid.liveneighbors(-1, 1) == 3);
    assert(grid.liveneighbors(5, 5) == 0);
    std::cout << "PASSED: test_neighbor_count\n";
}

void test_no_wraparound() {
    // a cell on the left edge must not see cells on the right edge
    lifegrid grid(5, 3);
    setrows(grid, 0, 4, "X/X/X");
    assert(grid.liveneighbors(1, 0) == 0);
    lifegrid next = grid.nextgeneration();
    assert(next.isalive(1, 0) == 0);
    std::cout << "PASSED: test_no_wraparound\n";
}

// Dead cell with exactly 3 neighbors is born
void test_birth_on_three() {
    lifegrid grid(5, 5);
    setrows(grid, 1, 1, "X.X/.../.X.");
    assert(grid.isalive(2, 2) == 0);
    assert(grid.liveneighbors(2, 2) == 3);
    lifegrid next = grid.nextgeneration();
    assert(next.isalive(2, 2) == 1);
    std::cout << "PASSED: test_birth_on_three\n";
}

// Dead cell with 2 or 4 neighbors stays dead
void test_no_birth_otherwise() {
    lifegrid grid(5, 5);
    setrows(grid, 1, 1, "X.X");
    assert(grid.liveneighbors(2, 2) == 2);
    assert(grid.nextgeneration().isalive(2, 2) == 0);
    lifegrid grid2(5, 5);
    setrows(grid2, 1, 1, "X.X/.../X.X");
    assert(grid2.liveneighbors(2, 2) == 4);
    assert(grid2.nextgeneration().isalive(2, 2) == 0);
    std::cout << "PASSED: test_no_birth_otherwise\n";
}

void test_death_by_underpopulation() {
    lifegrid grid(5, 5);
    setrows(grid, 2, 1, "XX");
    assert(grid.liveneighbors(2, 1) == 1);
    lifegrid next = grid.nextgeneration();
    assert(next.isalive(2, 1) == 0);
    assert(next.isalive(2, 2) == 0);
    lifegrid lonely(3, 3);
    lonely.setcell(1, 1, 1);
    assert(lonely.nextgeneration().isEmpty());
    std::cout << "PASSED: test_death_by_underpopulation\n";
}

void test_death_by_overpopulation() {
    lifegrid grid(5, 5);
    setrows(grid, 1, 1, "X.X/.X./X.X");
    assert(grid.liveneighbors(2, 2) == 4);
    assert(grid.nextgeneration().isalive(2, 2) == 0);
    lifegrid full(3, 3);
    setrows(full, 0, 0, "XXX/XXX/XXX");
    lifegrid next = full.nextgeneration();
    assert(next.isalive(1, 1) == 0);
    // corners have 3 neighbors and survive
    assert(next.isalive(0, 0) == 1);
    assert(next.isalive(2, 2) == 1);
    std::cout << "PASSED: test_death_by_overpopulation\n";
}

void test_survival_on_two_and_three() {
    lifegrid grid(5, 5);
    setrows(grid, 1, 1, "X../.X./..X");
    assert(grid.liveneighbors(2, 2) == 2);
    assert(grid.nextgeneration().isalive(2, 2) == 1);
    lifegrid grid2(5, 5);
    setrows(grid2, 1, 1, "XX./.X./..X");
    assert(grid2.liveneighbors(2, 2) == 3);
    assert(grid2.nextgeneration().isalive(2, 2) == 1);
    std::cout << "PASSED: test_survival_on_two_and_three\n";
}

void test_step_leaves_receiver_alone() {
    lifegrid grid(5, 5);
    setrows(grid, 2, 1, "XXX");
    lifegrid before = grid;
    lifegrid next = grid.nextgeneration();
    assert(grid == before);
    assert(next != grid);
    assert(next.getPopulation() == 3);
    std::cout << "PASSED: test_step_leaves_receiver_alone\n";
}

void test_findedges_and_getcells() {
    lifegrid grid(10, 8);
    int t = -1, l = -1, b = -1, r = -1;
    assert(grid.findedges(&t, &l, &b, &r) == 0);
    assert(t == -1);
    grid.setcell(2, 7, 1);
    grid.setcell(5, 3, 1);
    grid.setcell(4, 4, 1);
    assert(grid.findedges(&t, &l, &b, &r) == 1);
    assert(t == 2 && l == 3 && b == 5 && r == 7);
    vector<cellpos> cells;
    grid.getcells(cells);
    assert(cells.size() == 3);
    assert(cells[0] == cellpos(2, 7));
    assert(cells[1] == cellpos(4, 4));
    assert(cells[2] == cellpos(5, 3));
    std::cout << "PASSED: test_findedges_and_getcells\n";
}

int main() {
    test_new_grid_is_empty();
    test_empty_stays_empty();
    test_out_of_bounds();
    test_nonpositive_size();
    test_population_tracking();
    test_neighbor_count();
    test_no_wraparound();
    test_birth_on_three();
    test_no_birth_otherwise();
    test_death_by_underpopulation();
    test_death_by_overpopulation();
    test_survival_on_two_and_three();
    test_step_leaves_receiver_alone();
    test_findedges_and_getcells();

    std::cout << "\nAll grid tests passed!\n";
    return 0;
}
